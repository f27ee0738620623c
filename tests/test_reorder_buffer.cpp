#include <doctest/doctest.h>
#include <algorithm>
#include "creditrx/reorder_buffer.hpp"
#include "frames.hpp"

using namespace creditrx;
using namespace testing_frames;

TEST_CASE("In-order packets flush straight to the output") {
    ReorderBuffer rb;
    std::vector<uint8_t> out;
    for (uint32_t s = 0; s < 5; ++s) {
        ReorderBuffer::AdmitResult r = rb.admit(s, payload_of(s), out);
        CHECK(r.status == AdmitStatus::Flushed);
        CHECK(r.flushed == 1);
    }
    CHECK(rb.expected_seq() == 5u);
    CHECK(rb.empty());
    CHECK(out == stream_of(range(0, 5)));
}

TEST_CASE("Out-of-order packets are held and cascade once the gap fills") {
    ReorderBuffer rb;
    std::vector<uint8_t> out;

    CHECK(rb.admit(0, payload_of(0), out).status == AdmitStatus::Flushed);
    CHECK(rb.admit(2, payload_of(2), out).status == AdmitStatus::Buffered);
    CHECK(rb.admit(3, payload_of(3), out).status == AdmitStatus::Buffered);
    CHECK(rb.size() == 2);
    CHECK(rb.expected_seq() == 1u);

    ReorderBuffer::AdmitResult r = rb.admit(1, payload_of(1), out);
    CHECK(r.status == AdmitStatus::Flushed);
    CHECK(r.flushed == 3);
    CHECK(rb.empty());
    CHECK(rb.expected_seq() == 4u);
    CHECK(out == stream_of({0, 1, 2, 3}));
}

TEST_CASE("Stale and duplicate packets change nothing") {
    ReorderBuffer rb;
    std::vector<uint8_t> out;
    rb.admit(0, payload_of(0), out);
    rb.admit(1, payload_of(1), out);
    rb.admit(5, payload_of(5), out);
    const std::vector<uint8_t> before = out;

    CHECK(rb.admit(0, payload_of(0), out).status == AdmitStatus::Stale);
    CHECK(rb.admit(5, payload_of(99), out).status == AdmitStatus::Duplicate);
    CHECK(out == before);
    CHECK(rb.size() == 1);
    CHECK(rb.expected_seq() == 2u);
}

TEST_CASE("Duplicate keeps the first payload stored") {
    ReorderBuffer rb;
    std::vector<uint8_t> out;
    rb.admit(1, payload_of(1), out);
    rb.admit(1, payload_of(200), out);
    rb.admit(0, payload_of(0), out);
    CHECK(out == stream_of({0, 1}));
}

TEST_CASE("Overflow evicts the lowest keys down to half the cap") {
    ReorderBuffer rb(4);
    std::vector<uint8_t> out;

    for (uint32_t s = 1; s <= 4; ++s) {
        ReorderBuffer::AdmitResult r = rb.admit(s, payload_of(s), out);
        CHECK(r.evicted.empty());
    }
    ReorderBuffer::AdmitResult r = rb.admit(5, payload_of(5), out);
    CHECK(r.status == AdmitStatus::Buffered);
    REQUIRE(r.evicted.size() == 3);
    CHECK(r.evicted[0] == 1u);
    CHECK(r.evicted[1] == 2u);
    CHECK(r.evicted[2] == 3u);
    CHECK(rb.size() == 2);
    CHECK(rb.contains(4));
    CHECK(rb.contains(5));
    CHECK(rb.expected_seq() == 0u);
    CHECK(out.empty());
}

TEST_CASE("Size never exceeds the cap") {
    ReorderBuffer rb;
    std::vector<uint8_t> out;
    for (uint32_t s = 1; s < 1000; s += 3) {
        rb.admit(s, payload_of(s), out);
        CHECK(rb.size() <= rb.cap());
    }
}

TEST_CASE("Cap is clamped to its bounds") {
    ReorderBuffer rb;
    CHECK(rb.cap() == ReorderBuffer::CAP_DEFAULT);
    rb.set_cap(0);
    CHECK(rb.cap() == ReorderBuffer::CAP_MIN);
    rb.set_cap(10000);
    CHECK(rb.cap() == ReorderBuffer::CAP_CEILING);
}

TEST_CASE("skip_to moves forward, discards lower entries and drains") {
    ReorderBuffer rb;
    std::vector<uint8_t> out;
    rb.admit(0, payload_of(0), out);
    rb.admit(2, payload_of(2), out);
    rb.admit(6, payload_of(6), out);
    rb.admit(7, payload_of(7), out);

    ReorderBuffer::SkipResult s = rb.skip_to(6, out);
    CHECK(s.moved);
    CHECK(s.from == 1u);
    CHECK(s.to == 6u);
    CHECK(s.discarded == 1);      // seq 2 was below the target
    CHECK(s.flushed == 2);
    CHECK(rb.expected_seq() == 8u);
    CHECK(rb.empty());
    CHECK(out == stream_of({0, 6, 7}));
}

TEST_CASE("skip_to never moves backwards") {
    ReorderBuffer rb;
    std::vector<uint8_t> out;
    for (uint32_t s = 0; s < 4; ++s) rb.admit(s, payload_of(s), out);

    ReorderBuffer::SkipResult s = rb.skip_to(2, out);
    CHECK_FALSE(s.moved);
    CHECK(rb.expected_seq() == 4u);
    CHECK_FALSE(rb.skip_to(4, out).moved);
}

TEST_CASE("Lookup helpers") {
    ReorderBuffer rb;
    std::vector<uint8_t> out;
    uint32_t seq = 0;
    CHECK_FALSE(rb.min_buffered(seq));

    rb.admit(10, payload_of(10), out);
    rb.admit(20, payload_of(20), out);
    REQUIRE(rb.min_buffered(seq));
    CHECK(seq == 10u);
    REQUIRE(rb.lowest_at_or_above(11, seq));
    CHECK(seq == 20u);
    CHECK_FALSE(rb.lowest_at_or_above(21, seq));
}

TEST_CASE("reset forgets state but keeps the cap") {
    ReorderBuffer rb(8);
    std::vector<uint8_t> out;
    rb.admit(0, payload_of(0), out);
    rb.admit(3, payload_of(3), out);
    rb.reset();
    CHECK(rb.empty());
    CHECK(rb.expected_seq() == 0u);
    CHECK(rb.cap() == 8);
}

TEST_CASE("Output is the contiguous prefix for every arrival order") {
    // 4 never arrives, 2 arrives twice.
    std::vector<uint32_t> arrivals = {0, 1, 2, 2, 3, 5};
    std::sort(arrivals.begin(), arrivals.end());

    size_t orders = 0;
    do {
        ReorderBuffer rb;
        std::vector<uint8_t> out;
        uint32_t last_expected = 0;
        for (uint32_t s : arrivals) {
            rb.admit(s, payload_of(s), out);
            CHECK(rb.expected_seq() >= last_expected);
            last_expected = rb.expected_seq();
            CHECK(out == stream_of(range(0, rb.expected_seq())));
        }
        CHECK(out == stream_of({0, 1, 2, 3}));
        CHECK(rb.expected_seq() == 4u);
        CHECK(rb.size() == 1);
        ++orders;
    } while (std::next_permutation(arrivals.begin(), arrivals.end()));

    CHECK(orders == 360);                    // 6! / 2! distinct orders
}
