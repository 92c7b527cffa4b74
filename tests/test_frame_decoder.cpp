// Tests for brace-counting message framing on the command channel.

#include "channel/frame_decoder.hpp"

#include <iostream>
#include <string>

namespace test_frame_decoder {

static bool report(bool success, const std::string &description, const std::string &detail = "") {
    if (success) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << (detail.empty() ? "" : " (" + detail + ")") << std::endl;
    }
    return success;
}

static bool test_single_frame_with_leading_whitespace() {
    channel::FrameDecoder decoder;
    decoder.feed("\n  {\"text\":\"list tabs\"}\n");
    std::string frame;
    bool success = decoder.next_frame(frame) && frame == "{\"text\":\"list tabs\"}" && !decoder.next_frame(frame);
    return report(success, "bytes before the opening brace are skipped", frame);
}

static bool test_frame_split_across_reads() {
    channel::FrameDecoder decoder;
    std::string message = "{\"text\":\"go to example.com\",\"cwd\":\"/tmp\"}";
    std::string frame;
    bool ready_early = false;
    for (char character : message) {
        decoder.feed(&character, 1);
        if (decoder.next_frame(frame)) {
            ready_early = frame != message;
            break;
        }
    }
    bool success = !ready_early && frame == message;
    return report(success, "frame fed one byte at a time is reassembled", frame);
}

static bool test_braces_inside_strings() {
    channel::FrameDecoder decoder;
    std::string message = R"({"text":"run js ({a: \"}\"}).a","cwd":"{"})";
    decoder.feed(message);
    std::string frame;
    bool success = decoder.next_frame(frame) && frame == message;
    return report(success, "braces and escaped quotes inside strings do not end the frame", frame);
}

static bool test_two_frames_in_one_read() {
    channel::FrameDecoder decoder;
    decoder.feed("{\"a\":{\"b\":1}}{\"c\":2}");
    std::string first;
    std::string second;
    bool success = decoder.next_frame(first) && decoder.next_frame(second) && first == "{\"a\":{\"b\":1}}" &&
                   second == "{\"c\":2}";
    return report(success, "back-to-back frames are separated");
}

static bool test_partial_frame_tracking() {
    channel::FrameDecoder decoder;
    decoder.feed("{\"text\":\"unfinished");
    std::string frame;
    bool success = decoder.has_partial_frame() && !decoder.next_frame(frame);
    decoder.reset();
    success = success && !decoder.has_partial_frame();
    return report(success, "incomplete frame is reported as partial");
}

static bool test_oversized_frame() {
    channel::FrameDecoder decoder;
    std::string chunk(1024 * 1024, 'x');
    bool accepted = decoder.feed("{\"text\":\"");
    for (int index = 0; index < 17 && accepted; ++index) {
        accepted = decoder.feed(chunk);
    }
    bool success = !accepted && decoder.overflowed();
    return report(success, "frame larger than 16 MiB is rejected");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_single_frame_with_leading_whitespace();
    all_passed &= test_frame_split_across_reads();
    all_passed &= test_braces_inside_strings();
    all_passed &= test_two_frames_in_one_read();
    all_passed &= test_partial_frame_tracking();
    all_passed &= test_oversized_frame();
    return all_passed;
}

} // namespace test_frame_decoder
