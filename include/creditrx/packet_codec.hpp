/**
 * @file packet_codec.hpp
 * @brief Wire format of the notification channel: packet header, payload, CRC, end marker.
 *
 * @details
 * ## Wire layout
 * Every notification frame the peripheral emits is one packet:
 * ```
 *   offset  size  field
 *   0       4     sequence   (u32, little-endian, starts at 0)
 *   4       2     length     (u16, little-endian, 0..236)
 *   6       2     checksum   (u16, little-endian, CRC-16/CCITT-FALSE of payload)
 *   8       n     payload    (exactly `length` bytes)
 * ```
 * A frame with `length == 0` and `checksum == 0` is the **end marker**. Its
 * sequence field carries the last sequence number the sender used. Anything the
 * sender pads after an end-marker header is ignored.
 *
 * ---
 *
 * @par Validation policy
 * - **Header truncated** (< 8 bytes): rejected, nothing else is touched.
 * - **Length too large** (> 236): rejected.
 * - **Length mismatch** (trailing bytes != declared length): rejected.
 * - **Checksum mismatch**: accepted, with `checksum_ok == false`. The transfer has
 *   no retransmission path, so the receiver keeps the bytes and surfaces the
 *   integrity event instead of punching a hole in the stream.
 *
 * ---
 *
 * @par File-info record
 * Before the download the peripheral exposes one read-only record:
 * `[u32 LE size][UTF-8 name, NUL-terminated or NUL-padded]`. It travels over a
 * different path than the packets but shares the byte-order rules, so it lives here.
 *
 * @par Minimal usage
 * @code
 * creditrx::ParseResult r = creditrx::parse_packet(frame.data(), frame.size());
 * if (r.status == creditrx::FrameStatus::Ok) {
 *   // r.packet.sequence, r.packet.payload, r.packet.checksum_ok
 * } else if (r.status == creditrx::FrameStatus::EndMarker) {
 *   // sender is done
 * }
 * @endcode
 */
#ifndef CREDITRX_PACKET_CODEC_HPP
#define CREDITRX_PACKET_CODEC_HPP

#include <stddef.h>
#include <stdint.h>
#include <vector>
#include "etl/string.h"
#include "etl/vector.h"

namespace creditrx {

/// Fixed packet header size in bytes (seq32 + len16 + crc16).
static constexpr size_t HEADER_SIZE      = 8;

/// Largest payload a single notification may carry.
static constexpr size_t MAX_PAYLOAD      = 236;

/// Largest frame the transport may deliver (header + payload).
static constexpr size_t MAX_FRAME        = HEADER_SIZE + MAX_PAYLOAD;

/// Longest file name kept from the file-info record.
static constexpr size_t FILE_NAME_MAX    = 240;

/// Payload storage. Fixed capacity, no heap.
using Payload = etl::vector<uint8_t, MAX_PAYLOAD>;

/// File name storage.
using FileNameStr = etl::string<FILE_NAME_MAX>;

/**
 * @brief Outcome of parsing one raw frame.
 *
 * `Ok` and `EndMarker` produce a usable packet. Everything else is a
 * malformed frame that must be dropped without side effects.
 */
enum class FrameStatus : uint8_t {
  Ok              = 0,  ///< Data packet; check Packet::checksum_ok for integrity.
  EndMarker       = 1,  ///< length == 0 && checksum == 0.
  HeaderTruncated = 2,  ///< Fewer than HEADER_SIZE bytes.
  LengthTooLarge  = 3,  ///< Declared length above MAX_PAYLOAD.
  LengthMismatch  = 4   ///< Declared length differs from trailing byte count.
};

/// Short, log-friendly name of a FrameStatus ("ok", "header-truncated", ...).
const char* to_string(FrameStatus s);

/**
 * @brief One validated packet, or the end marker.
 *
 * Filled by parse_packet() and treated as read-only afterwards.
 */
struct Packet {
  uint32_t sequence{0};     ///< Sender-assigned sequence number.
  uint16_t length{0};       ///< Declared payload length.
  uint16_t checksum{0};     ///< CRC carried in the header.
  uint16_t computed{0};     ///< CRC computed over the received payload.
  bool     end_marker{false};
  bool     checksum_ok{true};
  Payload  payload;         ///< Exactly `length` bytes for data packets; empty for the end marker.

  bool is_end_marker() const { return end_marker; }
};

/// Status plus the packet it produced (meaningful for Ok/EndMarker only).
struct ParseResult {
  FrameStatus status{FrameStatus::HeaderTruncated};
  Packet      packet;

  bool usable() const {
    return status == FrameStatus::Ok || status == FrameStatus::EndMarker;
  }
};

/**
 * @brief CRC-16/CCITT-FALSE: poly 0x1021, init 0xFFFF, MSB-first, no final xor.
 *
 * Check value for the ASCII string "123456789" is 0x29B1.
 *
 * @param data Bytes to checksum (may be nullptr when len == 0).
 * @param len  Number of bytes.
 * @return 16-bit CRC.
 */
uint16_t crc16_ccitt(const uint8_t* data, size_t len);

/**
 * @brief Parse and validate one raw notification frame.
 *
 * Deterministic: the same bytes always give the same status, packet and
 * checksum verdict.
 *
 * @param frame Pointer to the frame bytes.
 * @param len   Frame length in bytes.
 * @return ParseResult; see FrameStatus for the rejection reasons.
 */
ParseResult parse_packet(const uint8_t* frame, size_t len);

/**
 * @brief Build the wire form of a data packet with a correct CRC.
 *
 * Used by tests and bridge tooling to synthesize sender traffic.
 *
 * @param sequence Sequence number.
 * @param payload  Payload bytes (at most MAX_PAYLOAD; longer input is truncated).
 * @param len      Payload length.
 * @param out      Receives the encoded frame (cleared first).
 */
void encode_packet(uint32_t sequence, const uint8_t* payload, size_t len, std::vector<uint8_t>& out);

/// Build an 8-byte end-marker frame carrying @p last_sequence.
void encode_end_marker(uint32_t last_sequence, std::vector<uint8_t>& out);

/// Declared file size and name, as read from the peripheral before download.
struct FileInfo {
  uint32_t    size{0};
  FileNameStr name;
};

/**
 * @brief Parse the one-time file-info record.
 *
 * The name ends at the first NUL if there is one (covers NUL-padded records);
 * otherwise the whole tail is the name. Names longer than FILE_NAME_MAX are cut.
 *
 * @param data Record bytes.
 * @param len  Record length.
 * @param out  Filled on success.
 * @retval true  Record had at least the 4-byte size field.
 * @retval false Record too short; @p out untouched.
 */
bool parse_file_info(const uint8_t* data, size_t len, FileInfo& out);

} // namespace creditrx

#endif // CREDITRX_PACKET_CODEC_HPP
