#include <doctest/doctest.h>
#include <cstring>
#include "creditrx/packet_codec.hpp"
#include "frames.hpp"

using namespace creditrx;
using namespace testing_frames;

TEST_CASE("CRC-16/CCITT-FALSE check value") {
    const char* s = "123456789";
    CHECK(crc16_ccitt(reinterpret_cast<const uint8_t*>(s), std::strlen(s)) == 0x29B1);
    CHECK(crc16_ccitt(nullptr, 0) == 0xFFFF);
}

TEST_CASE("Valid data frame parses with header fields and payload") {
    std::vector<uint8_t> f = data_frame(0x01020304, 10);
    ParseResult r = parse_packet(f.data(), f.size());

    REQUIRE(r.status == FrameStatus::Ok);
    CHECK(r.usable());
    CHECK(r.packet.sequence == 0x01020304u);
    CHECK(r.packet.length == 10);
    CHECK(r.packet.checksum_ok);
    CHECK_FALSE(r.packet.is_end_marker());
    std::vector<uint8_t> b = body(0x01020304, 10);
    CHECK(std::vector<uint8_t>(r.packet.payload.begin(), r.packet.payload.end()) == b);
}

TEST_CASE("Header fields are little-endian") {
    const uint8_t f[] = {0x05, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0xAA};
    ParseResult r = parse_packet(f, sizeof(f));
    CHECK(r.packet.sequence == 5u);
    CHECK(r.packet.length == 1);
    CHECK(r.status == FrameStatus::Ok);
    CHECK_FALSE(r.packet.checksum_ok);   // header crc 0 is wrong for 0xAA
}

TEST_CASE("Frame shorter than the header is rejected") {
    const uint8_t f[7] = {0};
    CHECK(parse_packet(f, sizeof(f)).status == FrameStatus::HeaderTruncated);
    CHECK(parse_packet(nullptr, 0).status == FrameStatus::HeaderTruncated);
    CHECK_FALSE(parse_packet(f, sizeof(f)).usable());
}

TEST_CASE("Declared length must match the bytes that follow") {
    std::vector<uint8_t> f = data_frame(3, 8);
    f.pop_back();
    CHECK(parse_packet(f.data(), f.size()).status == FrameStatus::LengthMismatch);

    f = data_frame(3, 8);
    f.push_back(0);
    CHECK(parse_packet(f.data(), f.size()).status == FrameStatus::LengthMismatch);
}

TEST_CASE("Declared length above the maximum payload is rejected") {
    std::vector<uint8_t> f(HEADER_SIZE + 240, 0);
    f[4] = 240;         // len = 240
    f[6] = 1;           // non-zero crc so it is not an end marker
    CHECK(parse_packet(f.data(), f.size()).status == FrameStatus::LengthTooLarge);
}

TEST_CASE("End marker is recognized even with trailing padding") {
    std::vector<uint8_t> f = end_frame(77);
    ParseResult r = parse_packet(f.data(), f.size());
    REQUIRE(r.status == FrameStatus::EndMarker);
    CHECK(r.packet.is_end_marker());
    CHECK(r.packet.sequence == 77u);
    CHECK(r.packet.payload.empty());

    f.insert(f.end(), 12, 0x00);
    r = parse_packet(f.data(), f.size());
    CHECK(r.status == FrameStatus::EndMarker);
    CHECK(r.packet.sequence == 77u);
}

TEST_CASE("Corrupted payload is parsed but flagged") {
    std::vector<uint8_t> f = data_frame(9, 16);
    f[HEADER_SIZE + 3] ^= 0x40;
    ParseResult r = parse_packet(f.data(), f.size());
    REQUIRE(r.status == FrameStatus::Ok);
    CHECK_FALSE(r.packet.checksum_ok);
    CHECK(r.packet.computed != r.packet.checksum);
    CHECK(r.packet.payload.size() == 16);
}

TEST_CASE("Parsing is deterministic") {
    std::vector<uint8_t> f = data_frame(42, 236);
    ParseResult a = parse_packet(f.data(), f.size());
    ParseResult b = parse_packet(f.data(), f.size());
    CHECK(a.status == b.status);
    CHECK(a.packet.sequence == b.packet.sequence);
    CHECK(a.packet.checksum_ok == b.packet.checksum_ok);
    CHECK(a.packet.payload == b.packet.payload);
}

TEST_CASE("encode_packet truncates oversize payloads") {
    std::vector<uint8_t> big(300, 0x11);
    std::vector<uint8_t> f;
    encode_packet(1, big.data(), big.size(), f);
    CHECK(f.size() == MAX_FRAME);
    CHECK(parse_packet(f.data(), f.size()).status == FrameStatus::Ok);
}

TEST_CASE("File info: NUL-terminated, NUL-padded and bare names") {
    FileInfo info;

    const uint8_t term[] = {0x10, 0x27, 0, 0, 'l', 'o', 'g', '.', 'b', 'i', 'n', 0};
    REQUIRE(parse_file_info(term, sizeof(term), info));
    CHECK(info.size == 10000u);
    CHECK(info.name == FileNameStr("log.bin"));

    const uint8_t padded[] = {1, 0, 0, 0, 'a', 0, 0, 0, 0};
    REQUIRE(parse_file_info(padded, sizeof(padded), info));
    CHECK(info.size == 1u);
    CHECK(info.name == FileNameStr("a"));

    const uint8_t bare[] = {0, 1, 0, 0, 'x', 'y'};
    REQUIRE(parse_file_info(bare, sizeof(bare), info));
    CHECK(info.size == 256u);
    CHECK(info.name == FileNameStr("xy"));

    const uint8_t no_name[] = {5, 0, 0, 0};
    REQUIRE(parse_file_info(no_name, sizeof(no_name), info));
    CHECK(info.size == 5u);
    CHECK(info.name.empty());
}

TEST_CASE("File info shorter than the size field is rejected") {
    FileInfo info;
    info.size = 123;
    const uint8_t rec[] = {1, 2, 3};
    CHECK_FALSE(parse_file_info(rec, sizeof(rec), info));
    CHECK(info.size == 123u);
}
