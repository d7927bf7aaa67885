/*
 * scriptdeck C++ - Result Channel Implementation
 */
#include <scriptdeck/sandbox/channel.hpp>

#include <cerrno>
#include <unistd.h>

namespace scriptdeck {

const char* frame_type_name(FrameType type) {
    switch (type) {
        case FrameType::STDOUT: return "STDOUT";
        case FrameType::STDERR: return "STDERR";
        case FrameType::RESULT: return "RESULT";
    }
    return "UNKNOWN";
}

static void put_header(std::string& out, FrameType type, size_t len) {
    uint32_t n = static_cast<uint32_t>(len);
    out += static_cast<char>(type);
    out += static_cast<char>((n >> 24) & 0xFF);
    out += static_cast<char>((n >> 16) & 0xFF);
    out += static_cast<char>((n >> 8) & 0xFF);
    out += static_cast<char>(n & 0xFF);
}

// ============ ChannelWriter ============

bool ChannelWriter::write_all(const char* data, size_t len) {
    size_t written = 0;
    while (written < len) {
        ssize_t n = ::write(fd_, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            broken_ = true;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

bool ChannelWriter::write_frame(FrameType type, const std::string& payload) {
    if (broken_) return false;
    
    size_t offset = 0;
    do {
        size_t chunk = payload.size() - offset;
        if (chunk > MAX_FRAME_PAYLOAD) chunk = MAX_FRAME_PAYLOAD;
        
        std::string frame;
        frame.reserve(FRAME_HEADER_SIZE + chunk);
        put_header(frame, type, chunk);
        frame.append(payload, offset, chunk);
        
        if (!write_all(frame.data(), frame.size())) {
            return false;
        }
        offset += chunk;
    } while (offset < payload.size());
    
    return true;
}

// ============ ChannelDecoder ============

std::string ChannelDecoder::encode(FrameType type, const std::string& payload) {
    std::string out;
    size_t offset = 0;
    do {
        size_t chunk = payload.size() - offset;
        if (chunk > MAX_FRAME_PAYLOAD) chunk = MAX_FRAME_PAYLOAD;
        put_header(out, type, chunk);
        out.append(payload, offset, chunk);
        offset += chunk;
    } while (offset < payload.size());
    return out;
}

void ChannelDecoder::feed(const char* data, size_t len) {
    if (corrupt_ || len == 0) return;
    
    // Compact consumed bytes before growing
    if (read_pos_ > 0 && read_pos_ >= buffer_.size() / 2) {
        buffer_.erase(0, read_pos_);
        read_pos_ = 0;
    }
    buffer_.append(data, len);
}

bool ChannelDecoder::next(Frame& out) {
    if (corrupt_) return false;
    if (pending_bytes() < FRAME_HEADER_SIZE) return false;
    
    const unsigned char* p =
        reinterpret_cast<const unsigned char*>(buffer_.data() + read_pos_);
    
    uint8_t type = p[0];
    if (type < static_cast<uint8_t>(FrameType::STDOUT) ||
        type > static_cast<uint8_t>(FrameType::RESULT)) {
        corrupt_ = true;
        return false;
    }
    
    size_t len = (static_cast<size_t>(p[1]) << 24) |
                 (static_cast<size_t>(p[2]) << 16) |
                 (static_cast<size_t>(p[3]) << 8) |
                  static_cast<size_t>(p[4]);
    if (len > MAX_FRAME_PAYLOAD) {
        corrupt_ = true;
        return false;
    }
    
    if (pending_bytes() < FRAME_HEADER_SIZE + len) {
        return false;
    }
    
    out.type = static_cast<FrameType>(type);
    out.payload.assign(buffer_, read_pos_ + FRAME_HEADER_SIZE, len);
    read_pos_ += FRAME_HEADER_SIZE + len;
    
    if (read_pos_ == buffer_.size()) {
        buffer_.clear();
        read_pos_ = 0;
    }
    return true;
}

} // namespace scriptdeck
