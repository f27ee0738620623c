#include <doctest/doctest.h>
#include "creditrx/flow_controller.hpp"

using namespace creditrx;

TEST_CASE("Default policy: 64 up front, 2 per 2 packets, 32 on stall") {
    FlowController fc;
    CHECK(fc.initial_grant() == 64);
    CHECK(fc.on_packet_consumed() == 0);
    CHECK(fc.on_packet_consumed() == 2);
    CHECK(fc.on_packet_consumed() == 0);
    CHECK(fc.on_packet_consumed() == 2);
    CHECK(fc.packets_consumed() == 4u);
    CHECK(fc.on_stall() == 32);
}

TEST_CASE("Only successful writes count as issued credits") {
    FlowController fc;
    CHECK(fc.record(64, true));
    CHECK_FALSE(fc.record(2, false));
    CHECK(fc.record(2, true));
    CHECK(fc.credits_issued() == 66u);
    CHECK(fc.grants_ok() == 2u);
    CHECK(fc.grants_failed() == 1u);
}

TEST_CASE("Custom cadence and a zero cadence treated as every packet") {
    FlowPolicy p;
    p.cadence_packets = 3;
    p.cadence_credits = 5;
    FlowController fc(p);
    CHECK(fc.on_packet_consumed() == 0);
    CHECK(fc.on_packet_consumed() == 0);
    CHECK(fc.on_packet_consumed() == 5);

    p.cadence_packets = 0;
    fc.set_policy(p);
    fc.reset();
    CHECK(fc.on_packet_consumed() == 5);
    CHECK(fc.on_packet_consumed() == 5);
}

TEST_CASE("reset clears counters") {
    FlowController fc;
    fc.record(10, true);
    fc.record(1, false);
    fc.on_packet_consumed();
    fc.reset();
    CHECK(fc.credits_issued() == 0u);
    CHECK(fc.grants_failed() == 0u);
    CHECK(fc.packets_consumed() == 0u);
}
