/*
 * scriptdeck C++ - Captured output sink Implementation
 */
#include <scriptdeck/sandbox/output_sink.hpp>
#include <scriptdeck/sandbox/types.hpp>
#include <scriptdeck/core/utils.hpp>
#include <scriptdeck/core/logger.hpp>

namespace scriptdeck {

const size_t OutputSink::BUFFER_LIMIT;

OutputSink::OutputSink(ChannelWriter& channel, size_t max_output_bytes)
    : channel_(channel)
    , max_output_bytes_(max_output_bytes)
    , emitted_(0)
    , truncated_(false) {}

std::string& OutputSink::buffer_for(FrameType stream) {
    return stream == FrameType::STDERR ? stderr_buffer_ : stdout_buffer_;
}

void OutputSink::write(FrameType stream, const std::string& text) {
    if (truncated_ || text.empty()) return;
    
    std::string& buffer = buffer_for(stream);
    buffer += text;
    
    if (buffer.size() >= BUFFER_LIMIT) {
        flush(stream);
        return;
    }
    
    size_t last_newline = buffer.rfind('\n');
    if (last_newline != std::string::npos) {
        std::string complete = buffer.substr(0, last_newline + 1);
        buffer.erase(0, last_newline + 1);
        emit(stream, complete);
    }
}

void OutputSink::flush(FrameType stream) {
    std::string& buffer = buffer_for(stream);
    if (buffer.empty()) return;
    
    std::string pending;
    pending.swap(buffer);
    emit(stream, pending);
}

void OutputSink::flush_all() {
    flush(FrameType::STDOUT);
    flush(FrameType::STDERR);
}

void OutputSink::emit(FrameType stream, const std::string& text) {
    if (truncated_ || channel_.broken()) return;
    
    if (emitted_ + text.size() <= max_output_bytes_) {
        emitted_ += text.size();
        if (!channel_.write_frame(stream, text)) {
            LOG_WARN("[Worker] Result channel closed, dropping captured output");
        }
        return;
    }
    
    std::string head = truncate_safe(text, max_output_bytes_ - emitted_);
    emitted_ += head.size();
    truncated_ = true;
    stdout_buffer_.clear();
    stderr_buffer_.clear();
    
    if (!channel_.write_frame(stream, head + OUTPUT_TRUNCATED_MARKER)) {
        LOG_WARN("[Worker] Result channel closed, dropping captured output");
    }
}

} // namespace scriptdeck
