#include "protocol/message_framer.hpp"
#include <algorithm>
#include <cctype>

namespace arbexec {

MessageFramer::MessageFramer(FramingMode mode, size_t max_frame_bytes)
    : mode_(mode)
    , max_frame_bytes_(max_frame_bytes)
{
}

std::vector<MessageFramer::Frame> MessageFramer::feed(const char* data, size_t len) {
    if (mode_ == FramingMode::LINE) {
        return feed_lines(data, len);
    }

    // Blank chunks are passed on too and fail to decode like any other bad payload
    std::vector<Frame> frames;
    frames.push_back(Frame{std::string(data, len), false});
    return frames;
}

std::vector<MessageFramer::Frame> MessageFramer::feed_lines(const char* data, size_t len) {
    std::vector<Frame> frames;
    const char* end = data + len;

    while (data < end) {
        const char* newline = std::find(data, end, '\n');
        bool complete = newline != end;

        if (discarding_) {
            // Still inside an oversized line, drop bytes until its end
            if (complete) {
                discarding_ = false;
                data = newline + 1;
                continue;
            }
            break;
        }

        buffer_.append(data, newline);

        if (!complete) {
            // One byte of slack for a '\r' whose '\n' has not arrived yet
            if (buffer_.size() > max_frame_bytes_ + 1) {
                frames.push_back(Frame{"", true});
                buffer_.clear();
                discarding_ = true;
            }
            break;
        }

        if (!buffer_.empty() && buffer_.back() == '\r') {
            buffer_.pop_back();
        }
        if (buffer_.size() > max_frame_bytes_) {
            frames.push_back(Frame{"", true});
        } else if (!is_blank(buffer_)) {
            frames.push_back(Frame{std::move(buffer_), false});
        }
        buffer_.clear();
        data = newline + 1;
    }

    return frames;
}

bool MessageFramer::is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace arbexec
