/*
 * scriptdeck C++ - Result Channel
 *
 * One-way framed stream from the worker to the supervisor:
 *
 *   +------+----------------+-----------------+
 *   | type | length (4, BE) | payload         |
 *   +------+----------------+-----------------+
 *
 * STDOUT / STDERR frames carry captured output as it is produced, the
 * single RESULT frame carries the WorkerReport JSON. Nothing is ever sent
 * back to the worker.
 */
#ifndef scriptdeck_SANDBOX_CHANNEL_HPP
#define scriptdeck_SANDBOX_CHANNEL_HPP

#include <string>
#include <cstdint>
#include <cstddef>

namespace scriptdeck {

enum class FrameType : uint8_t {
    STDOUT = 1,
    STDERR = 2,
    RESULT = 3
};

const char* frame_type_name(FrameType type);

static const size_t FRAME_HEADER_SIZE = 5;
static const size_t MAX_FRAME_PAYLOAD = 1024 * 1024;

struct Frame {
    FrameType type;
    std::string payload;
    
    Frame() : type(FrameType::STDOUT) {}
};

// Worker side. Does not own the descriptor.
class ChannelWriter {
public:
    explicit ChannelWriter(int fd) : fd_(fd), broken_(false) {}
    
    // Payloads longer than MAX_FRAME_PAYLOAD go out as several frames of
    // the same type. Returns false once the reader is gone.
    bool write_frame(FrameType type, const std::string& payload);
    
    bool broken() const { return broken_; }
    int fd() const { return fd_; }
    
private:
    bool write_all(const char* data, size_t len);
    
    int fd_;
    bool broken_;
};

// Supervisor side. Feed raw bytes as they arrive, pop complete frames.
class ChannelDecoder {
public:
    ChannelDecoder() : read_pos_(0), corrupt_(false) {}
    
    void feed(const char* data, size_t len);
    
    // Pops the next complete frame. A partial frame stays buffered until
    // more bytes arrive; at end of stream it is simply never returned.
    bool next(Frame& out);
    
    // Set when an unknown frame type or an oversized length was seen.
    // Nothing after that point is decoded.
    bool corrupt() const { return corrupt_; }
    
    size_t pending_bytes() const { return buffer_.size() - read_pos_; }
    
    static std::string encode(FrameType type, const std::string& payload);
    
private:
    std::string buffer_;
    size_t read_pos_;
    bool corrupt_;
};

} // namespace scriptdeck

#endif // scriptdeck_SANDBOX_CHANNEL_HPP
