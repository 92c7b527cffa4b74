#include "channel/frame_decoder.hpp"

namespace channel {

bool FrameDecoder::feed(const char *data, size_t length) {
    if (overflowed_) {
        return false;
    }

    for (size_t position = 0; position < length; position++) {
        char character = data[position];

        if (!started_) {
            if (character == '{') {
                started_ = true;
                brace_depth_ = 1;
                inside_string_ = false;
                escape_next_ = false;
                current_frame_.assign(1, character);
            }
            continue;
        }

        current_frame_ += character;
        if (current_frame_.size() > kMaxFrameBytes) {
            overflowed_ = true;
            current_frame_.clear();
            return false;
        }

        if (escape_next_) {
            escape_next_ = false;
            continue;
        }

        if (character == '\\' && inside_string_) {
            escape_next_ = true;
            continue;
        }

        if (character == '"') {
            inside_string_ = !inside_string_;
            continue;
        }

        if (inside_string_) {
            continue;
        }

        if (character == '{') {
            brace_depth_++;
        } else if (character == '}') {
            brace_depth_--;
            if (brace_depth_ == 0) {
                complete_frames_.push_back(std::move(current_frame_));
                current_frame_.clear();
                started_ = false;
            }
        }
    }
    return true;
}

bool FrameDecoder::next_frame(std::string &out_frame) {
    if (complete_frames_.empty()) {
        return false;
    }
    out_frame = std::move(complete_frames_.front());
    complete_frames_.pop_front();
    return true;
}

void FrameDecoder::reset() {
    complete_frames_.clear();
    current_frame_.clear();
    brace_depth_ = 0;
    inside_string_ = false;
    escape_next_ = false;
    started_ = false;
    overflowed_ = false;
}

} // namespace channel
