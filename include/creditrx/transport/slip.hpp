#pragma once

/**
 * @file slip.hpp
 * @brief SLIP (RFC 1055) framing for the serial link to the BLE bridge.
 *
 * @details
 * The bridge dongle and the host exchange small messages over a raw TTY. SLIP
 * gives each message a boundary:
 *
 *   END     0xC0   opens and closes a frame
 *   ESC     0xDB   escape introducer
 *   ESC_END 0xDC   ESC ESC_END stands for a literal END
 *   ESC_ESC 0xDD   ESC ESC_ESC stands for a literal ESC
 *
 * The decoder is fed one byte at a time from the reader thread. It resynchronizes
 * on the next END after garbage, a malformed escape, or a frame that grows past
 * `max_frame` (bridge messages are at most one tag byte plus one notification).
 *
 * SLIP is framing only. Integrity of packet payloads is the packet CRC's job.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace creditrx::transport::slip {

static constexpr uint8_t END     = 0xC0;
static constexpr uint8_t ESC     = 0xDB;
static constexpr uint8_t ESC_END = 0xDC;
static constexpr uint8_t ESC_ESC = 0xDD;

/**
 * @brief Append one SLIP frame carrying @p n bytes of @p in to @p out.
 *
 * Unlike a clearing encoder, this appends, so a tag byte and a body can be
 * framed by the caller into a single buffer without an intermediate copy.
 */
inline void encode(const uint8_t* in, std::size_t n, std::vector<uint8_t>& out) {
  out.reserve(out.size() + n * 2 + 2);
  out.push_back(END);
  for (std::size_t i = 0; i < n; ++i) {
    const uint8_t b = in[i];
    if (b == END)      { out.push_back(ESC); out.push_back(ESC_END); }
    else if (b == ESC) { out.push_back(ESC); out.push_back(ESC_ESC); }
    else               out.push_back(b);
  }
  out.push_back(END);
}

/**
 * @brief Byte-at-a-time SLIP decoder.
 *
 * `feed()` returns true when a non-empty frame closes; the payload is then in
 * the caller's vector. `dropped()` counts frames discarded for malformed escapes
 * or overlength, for link diagnostics.
 */
class Decoder {
public:
  explicit Decoder(std::size_t max_frame = 512) : max_frame_(max_frame) {}

  bool feed(uint8_t b, std::vector<uint8_t>& frame) {
    if (b == END) {
      const bool done = in_frame_ && !buf_.empty();
      if (done) frame.assign(buf_.begin(), buf_.end());
      buf_.clear();
      esc_      = false;
      in_frame_ = !done;     // a closing END ends the frame; any other END opens one
      return done;
    }

    if (!in_frame_) return false;   // noise before the first END

    if (esc_) {
      esc_ = false;
      if      (b == ESC_END) b = END;
      else if (b == ESC_ESC) b = ESC;
      else { drop(); return false; }
    } else if (b == ESC) {
      esc_ = true;
      return false;
    }

    if (buf_.size() >= max_frame_) { drop(); return false; }
    buf_.push_back(b);
    return false;
  }

  std::size_t dropped() const { return dropped_; }

  void reset() { buf_.clear(); esc_ = false; in_frame_ = false; }

private:
  void drop() {
    reset();
    ++dropped_;
  }

  std::vector<uint8_t> buf_;
  std::size_t max_frame_;
  std::size_t dropped_{0};
  bool esc_{false};
  bool in_frame_{false};
};

} // namespace creditrx::transport::slip
