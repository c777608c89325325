#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include "common/types.hpp"

namespace arbexec {

/**
 * Splits a connection's inbound byte stream into request payloads.
 *
 * LINE mode buffers across reads and emits one frame per '\n'-terminated
 * line, skipping whitespace-only lines. A trailing '\r' is stripped before
 * the size check. A partial line growing past max_frame_bytes is emitted
 * once as an oversized frame and the rest of that line is dropped.
 *
 * READ mode treats every chunk handed to feed() as one message, blank or not.
 */
class MessageFramer {
public:
    struct Frame {
        std::string payload;
        bool oversized{false};
    };

    MessageFramer(FramingMode mode, size_t max_frame_bytes);

    std::vector<Frame> feed(const char* data, size_t len);

    // Bytes held for an incomplete line
    size_t buffered() const { return buffer_.size(); }

    size_t max_frame_bytes() const { return max_frame_bytes_; }

    // Terminator appended to every encoded response
    std::string terminator() const { return mode_ == FramingMode::LINE ? "\n" : ""; }

private:
    FramingMode mode_;
    size_t max_frame_bytes_;
    std::string buffer_;
    bool discarding_{false};

    std::vector<Frame> feed_lines(const char* data, size_t len);
    static bool is_blank(const std::string& s);
};

} // namespace arbexec
