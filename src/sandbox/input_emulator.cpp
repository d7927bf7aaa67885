/*
 * scriptdeck C++ - Input Emulator Implementation
 */
#include <scriptdeck/sandbox/input_emulator.hpp>

namespace scriptdeck {

const char* const END_OF_INPUT_MESSAGE = "EOF when reading a line";

InputEmulator::InputEmulator(const std::string& stdin_text)
    : lines_(split_lines(stdin_text))
    , position_(0) {}

bool InputEmulator::next_line(const std::string& prompt, std::string& line, std::string& echo) {
    echo = prompt;
    if (position_ >= lines_.size()) {
        return false;
    }
    
    line = lines_[position_++];
    echo += line;
    echo += '\n';
    return true;
}

std::vector<std::string> InputEmulator::split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
            lines.push_back(current);
            current.clear();
        } else if (c == '\n') {
            lines.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

} // namespace scriptdeck
