/*
 * scriptdeck C++ - Input Emulator
 *
 * Turns the request's stdin text into a queue of lines handed out one per
 * input() call, echoing like a terminal would:
 *
 *   input("Name? ")  ->  stdout gets "Name? Alice\n", returns "Alice"
 *
 * Exhaustion is reported, never an empty line and never a blocking read.
 */
#ifndef scriptdeck_SANDBOX_INPUT_EMULATOR_HPP
#define scriptdeck_SANDBOX_INPUT_EMULATOR_HPP

#include <string>
#include <vector>
#include <cstddef>

namespace scriptdeck {

extern const char* const END_OF_INPUT_MESSAGE;

class InputEmulator {
public:
    explicit InputEmulator(const std::string& stdin_text);
    
    // Hand out the next line. `echo` receives the text to append to the
    // captured stdout (the prompt, then the line and a newline). Returns
    // false when no line is left; `echo` then holds only the prompt.
    bool next_line(const std::string& prompt, std::string& line, std::string& echo);
    
    size_t remaining() const { return lines_.size() - position_; }
    
    // Split on "\n", "\r\n" and "\r". A trailing separator does not add
    // an empty last line.
    static std::vector<std::string> split_lines(const std::string& text);
    
private:
    std::vector<std::string> lines_;
    size_t position_;
};

} // namespace scriptdeck

#endif // scriptdeck_SANDBOX_INPUT_EMULATOR_HPP
