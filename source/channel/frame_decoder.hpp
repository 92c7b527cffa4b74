#ifndef NLBD_FRAME_DECODER_HPP
#define NLBD_FRAME_DECODER_HPP

// Incremental framing for the command channel.
// Every message is one JSON object; its end is found by brace counting with
// string/escape awareness, so the stream needs no length prefix and bytes may
// arrive split at any boundary. Anything before an opening brace (whitespace,
// newlines) is skipped.

#include <cstddef>
#include <deque>
#include <string>

namespace channel {

class FrameDecoder {
public:
    static constexpr size_t kMaxFrameBytes = 16 * 1024 * 1024;

    // Scan more bytes. Returns false once the frame being assembled grows past
    // kMaxFrameBytes; the decoder then stays in the overflowed state until reset().
    bool feed(const char *data, size_t length);
    bool feed(const std::string &data) { return feed(data.data(), data.size()); }

    // Pop the oldest complete frame. Returns false if none is ready.
    bool next_frame(std::string &out_frame);

    // True while an opening brace has been seen but the matching close has not.
    bool has_partial_frame() const { return started_; }

    bool overflowed() const { return overflowed_; }

    void reset();

private:
    std::deque<std::string> complete_frames_;
    std::string current_frame_;
    int brace_depth_ = 0;
    bool inside_string_ = false;
    bool escape_next_ = false;
    bool started_ = false;
    bool overflowed_ = false;
};

} // namespace channel

#endif // NLBD_FRAME_DECODER_HPP
