/*
 * scriptdeck C++ - Captured output sink
 *
 * Sits between the script's stdout/stderr streams and the Result Channel.
 * Text is buffered per stream and sent as STDOUT / STDERR frames on every
 * complete line or when a buffer fills up. A byte budget shared by both
 * streams caps what reaches the supervisor; past it a single truncation
 * marker is sent and everything else is dropped.
 */
#ifndef scriptdeck_SANDBOX_OUTPUT_SINK_HPP
#define scriptdeck_SANDBOX_OUTPUT_SINK_HPP

#include <scriptdeck/sandbox/channel.hpp>
#include <string>
#include <cstddef>

namespace scriptdeck {

class OutputSink {
public:
    static const size_t BUFFER_LIMIT = 4096;
    
    OutputSink(ChannelWriter& channel, size_t max_output_bytes);
    
    // `stream` is STDOUT or STDERR
    void write(FrameType stream, const std::string& text);
    void flush(FrameType stream);
    void flush_all();
    
    bool truncated() const { return truncated_; }
    size_t emitted_bytes() const { return emitted_; }
    
private:
    std::string& buffer_for(FrameType stream);
    void emit(FrameType stream, const std::string& text);
    
    ChannelWriter& channel_;
    size_t max_output_bytes_;
    size_t emitted_;
    bool truncated_;
    std::string stdout_buffer_;
    std::string stderr_buffer_;
};

} // namespace scriptdeck

#endif // scriptdeck_SANDBOX_OUTPUT_SINK_HPP
