#pragma once
/**
 * @file slip.hpp
 * @brief RFC 1055 SLIP framing for the radio bridge link.
 *
 * @details
 * The serial line is a byte stream; SLIP cuts it into frames. Each frame is
 * sent as `END payload END`, with END and ESC inside the payload escaped as
 * two-byte sequences. The leading END flushes any line noise the receiver
 * has accumulated.
 *
 * The decoder is a byte-at-a-time state machine that lives as long as the
 * port does, so bytes of the next frame that arrive in the same read() are
 * never lost between calls.
 *
 * Error policy: a malformed escape or an oversized frame drops the partial
 * frame and waits for the next END. Nothing throws.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace meshwx {
namespace slip {

constexpr uint8_t END     = 0xC0;
constexpr uint8_t ESC     = 0xDB;
constexpr uint8_t ESC_END = 0xDC;
constexpr uint8_t ESC_ESC = 0xDD;

/// Frames larger than this are noise; the bridge never sends more than a few hundred bytes.
constexpr size_t MAX_FRAME = 1024;

/// Append the SLIP encoding of @p payload (with both END delimiters) to @p out.
inline void encode(const std::vector<uint8_t>& payload, std::vector<uint8_t>& out) {
    out.reserve(out.size() + payload.size() * 2 + 2);
    out.push_back(END);
    for (uint8_t b : payload) {
        if (b == END)      { out.push_back(ESC); out.push_back(ESC_END); }
        else if (b == ESC) { out.push_back(ESC); out.push_back(ESC_ESC); }
        else               { out.push_back(b); }
    }
    out.push_back(END);
}

inline std::vector<uint8_t> encode(const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> out;
    encode(payload, out);
    return out;
}

class Decoder {
public:
    /**
     * @brief Consume one byte.
     * @return true when @p b closed a non-empty frame; the payload is then in @p frame.
     */
    bool feed(uint8_t b, std::vector<uint8_t>& frame) {
        if (b == END) {
            const bool complete = in_frame_ && !buf_.empty();
            if (complete) frame.swap(buf_);
            buf_.clear();
            in_frame_ = true;      // an END both closes and opens
            esc_ = false;
            return complete;
        }
        if (!in_frame_) return false;

        if (esc_) {
            esc_ = false;
            if (b == ESC_END)      b = END;
            else if (b == ESC_ESC) b = ESC;
            else { drop(); return false; }
        } else if (b == ESC) {
            esc_ = true;
            return false;
        }

        if (buf_.size() >= MAX_FRAME) { drop(); return false; }
        buf_.push_back(b);
        return false;
    }

    /// Forget any partial frame (after reopening the port).
    void reset() { buf_.clear(); esc_ = false; in_frame_ = false; }

    size_t dropped() const { return dropped_; }

private:
    void drop() { buf_.clear(); esc_ = false; in_frame_ = false; ++dropped_; }

    std::vector<uint8_t> buf_;
    bool esc_ = false;
    bool in_frame_ = false;
    size_t dropped_ = 0;
};

} // namespace slip
} // namespace meshwx
