// -----------------------------------------------------------------------------
// packet_codec.cpp: wire parsing for creditrx notification frames
//
// API & field descriptions:
//   see include/creditrx/packet_codec.hpp
//
// Tests:
//   see tests/test_packet_codec.cpp
// -----------------------------------------------------------------------------
#include "creditrx/packet_codec.hpp"

namespace creditrx {

namespace {

uint16_t read_le16(const uint8_t* p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_le32(const uint8_t* p) {
  return  static_cast<uint32_t>(p[0])
       | (static_cast<uint32_t>(p[1]) << 8)
       | (static_cast<uint32_t>(p[2]) << 16)
       | (static_cast<uint32_t>(p[3]) << 24);
}

void put_le16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>(v >> 8));
}

void put_le32(std::vector<uint8_t>& out, uint32_t v) {
  for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

} // namespace

const char* to_string(FrameStatus s) {
  switch (s) {
    case FrameStatus::Ok:              return "ok";
    case FrameStatus::EndMarker:       return "end-marker";
    case FrameStatus::HeaderTruncated: return "header-truncated";
    case FrameStatus::LengthTooLarge:  return "length-too-large";
    case FrameStatus::LengthMismatch:  return "length-mismatch";
  }
  return "unknown";
}

// crc16_ccitt(): bitwise, MSB-first. Payloads are <= 236 bytes, so a table
// would cost more flash than it saves time.
uint16_t crc16_ccitt(const uint8_t* data, size_t len) {
  uint16_t crc = 0xFFFF;
  for (size_t i = 0; i < len; ++i) {
    crc ^= static_cast<uint16_t>(data[i] << 8);
    for (int bit = 0; bit < 8; ++bit) {
      if (crc & 0x8000) crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
      else              crc = static_cast<uint16_t>(crc << 1);
    }
  }
  return crc;
}

// -----------------------------------------------------------------------------
// parse_packet()
// ORDER:
//   1) header length
//   2) end marker (before length matching: senders pad the marker frame)
//   3) declared length bounds, then exact match
//   4) CRC verdict (never a rejection)
// -----------------------------------------------------------------------------
ParseResult parse_packet(const uint8_t* frame, size_t len) {
  ParseResult r;
  if (!frame || len < HEADER_SIZE) {
    r.status = FrameStatus::HeaderTruncated;
    return r;
  }

  Packet& p = r.packet;
  p.sequence = read_le32(frame);
  p.length   = read_le16(frame + 4);
  p.checksum = read_le16(frame + 6);

  if (p.length == 0 && p.checksum == 0) {
    p.end_marker = true;
    r.status = FrameStatus::EndMarker;
    return r;
  }

  if (p.length > MAX_PAYLOAD) {
    r.status = FrameStatus::LengthTooLarge;
    return r;
  }

  const size_t trailing = len - HEADER_SIZE;
  if (trailing != p.length) {
    r.status = FrameStatus::LengthMismatch;
    return r;
  }

  const uint8_t* body = frame + HEADER_SIZE;
  p.payload.assign(body, body + p.length);
  p.computed    = crc16_ccitt(body, p.length);
  p.checksum_ok = (p.computed == p.checksum);
  r.status = FrameStatus::Ok;
  return r;
}

void encode_packet(uint32_t sequence, const uint8_t* payload, size_t len, std::vector<uint8_t>& out) {
  if (len > MAX_PAYLOAD) len = MAX_PAYLOAD;
  out.clear();
  out.reserve(HEADER_SIZE + len);
  put_le32(out, sequence);
  put_le16(out, static_cast<uint16_t>(len));
  put_le16(out, crc16_ccitt(payload, len));
  if (len) out.insert(out.end(), payload, payload + len);
}

void encode_end_marker(uint32_t last_sequence, std::vector<uint8_t>& out) {
  out.clear();
  put_le32(out, last_sequence);
  put_le16(out, 0);
  put_le16(out, 0);
}

bool parse_file_info(const uint8_t* data, size_t len, FileInfo& out) {
  if (!data || len < 4) return false;

  FileInfo info;
  info.size = read_le32(data);

  const uint8_t* name = data + 4;
  size_t n = len - 4;
  for (size_t i = 0; i < n; ++i) {       // stop at first NUL if present
    if (name[i] == 0) { n = i; break; }
  }
  if (n > FILE_NAME_MAX) n = FILE_NAME_MAX;
  info.name.assign(reinterpret_cast<const char*>(name), n);

  out = info;
  return true;
}

} // namespace creditrx
