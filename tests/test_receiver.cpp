#include <doctest/doctest.h>
#include <atomic>
#include <functional>
#include "creditrx/receiver.hpp"
#include "frames.hpp"

using namespace creditrx;
using namespace creditrx::transport;
using namespace testing_frames;

namespace {

struct FakeChannel : IChannel {
    FrameHandler handler;
    int  subscribes{0};
    int  unsubscribes{0};
    bool refuse{false};
    bool link{true};
    int  failing_writes{0};
    std::vector<uint8_t> grants;
    std::function<void()> on_subscribe;      // runs once the handler is installed

    bool subscribe(FrameHandler h) override {
        ++subscribes;
        if (refuse) return false;
        handler = std::move(h);
        if (on_subscribe) on_subscribe();
        return true;
    }
    void unsubscribe() override {
        ++unsubscribes;
        handler = nullptr;
    }
    TxResult write_credits(uint8_t n) override {
        grants.push_back(n);
        if (failing_writes > 0) { --failing_writes; return TxResult::Busy; }
        return TxResult::Ok;
    }
    bool read_file_info(std::vector<uint8_t>& out) override { out.clear(); return true; }
    bool connected() const override { return link; }
    const char* name() const override { return "fake"; }

    void deliver(const std::vector<uint8_t>& f) {
        if (handler) handler(f.data(), f.size());
    }
};

// Virtual time: the sleeper advances the clock and runs the per-tick script.
struct Harness {
    FakeChannel ch;
    uint64_t now{1000};
    int ticks{0};
    std::function<void(int tick)> on_tick;
    std::vector<Event> events;
    std::atomic<bool> stop{false};

    Receiver make(const SessionConfig& cfg = SessionConfig{}) {
        return Receiver(ch, cfg,
            [this](const Event& e) { events.push_back(e); },
            [this] { return now; },
            [this](uint32_t ms) {
                now += ms;
                ++ticks;
                if (on_tick) on_tick(ticks);
            });
    }

    size_t count(EventKind k) const {
        size_t n = 0;
        for (const Event& e : events) if (e.kind == k) ++n;
        return n;
    }
};

} // namespace

TEST_CASE("Receiver runs a clean transfer to completion") {
    Harness h;
    h.on_tick = [&h](int tick) {
        if (tick != 1) return;
        for (uint32_t q = 0; q < 10; ++q) h.ch.deliver(data_frame(q));
        h.ch.deliver(end_frame(10));
    };
    Receiver rx = h.make();
    Summary s = rx.run(40, h.stop);

    CHECK(s.state == SessionState::Complete);
    CHECK(s.bytes_received == 40u);
    CHECK(h.ch.subscribes == 1);
    CHECK(h.ch.unsubscribes == 1);
    REQUIRE(h.ch.grants.size() == 6);
    CHECK(h.ch.grants[0] == 64);
    CHECK(h.ch.grants[1] == 2);
    CHECK(s.credits_issued == 74u);
    CHECK(rx.take_data() == stream_of(range(0, 10)));

    REQUIRE_FALSE(h.events.empty());
    CHECK(h.events.back().kind == EventKind::Finished);
    CHECK(h.count(EventKind::Finished) == 1);
}

TEST_CASE("Receiver times out when nothing arrives") {
    Harness h;
    Receiver rx = h.make();
    Summary s = rx.run(1000, h.stop);

    CHECK(s.state == SessionState::TimedOut);
    CHECK(s.bytes_received == 0u);
    CHECK(h.ch.unsubscribes == 1);
    CHECK(h.ticks == 121);                   // first sample past 60 s
    CHECK(h.count(EventKind::TimedOut) == 1);
    CHECK(h.count(EventKind::Stalled) > 0);
}

TEST_CASE("Stop flag aborts as interrupted and still unsubscribes once") {
    Harness h;
    h.on_tick = [&h](int tick) {
        h.ch.deliver(data_frame(static_cast<uint32_t>(tick - 1)));
        if (tick == 3) h.stop = true;
    };
    Receiver rx = h.make();
    Summary s = rx.run(1000, h.stop);

    CHECK(s.state == SessionState::Aborted);
    CHECK(s.reason == ReasonStr("interrupted"));
    CHECK(s.bytes_received == 12u);
    CHECK(h.ch.unsubscribes == 1);
    CHECK(h.ticks == 3);
}

TEST_CASE("Lost link aborts as disconnected") {
    Harness h;
    h.on_tick = [&h](int tick) { if (tick == 2) h.ch.link = false; };
    Receiver rx = h.make();
    Summary s = rx.run(1000, h.stop);

    CHECK(s.state == SessionState::Aborted);
    CHECK(s.reason == ReasonStr("disconnected"));
    CHECK(h.ch.unsubscribes == 1);
}

TEST_CASE("Refused subscription aborts without an unsubscribe") {
    Harness h;
    h.ch.refuse = true;
    Receiver rx = h.make();
    Summary s = rx.run(1000, h.stop);

    CHECK(s.state == SessionState::Aborted);
    CHECK(s.reason == ReasonStr("subscribe failed"));
    CHECK(h.ch.subscribes == 1);
    CHECK(h.ch.unsubscribes == 0);
    CHECK(h.ch.grants.empty());
    CHECK(h.ticks == 0);
    CHECK(h.count(EventKind::Finished) == 1);
}

TEST_CASE("Failed credit write is reported and the transfer carries on") {
    Harness h;
    h.ch.failing_writes = 1;                 // the initial burst
    h.on_tick = [&h](int tick) {
        if (tick != 1) return;
        for (uint32_t q = 0; q < 4; ++q) h.ch.deliver(data_frame(q));
    };
    Receiver rx = h.make();
    Summary s = rx.run(16, h.stop);

    CHECK(s.state == SessionState::Complete);
    CHECK(s.credit_writes_failed == 1u);
    CHECK(s.credits_issued == 4u);
    CHECK(h.count(EventKind::TransportWriteFailed) == 1);
}

TEST_CASE("Stop requested before the first sample ends the run without sleeping") {
    Harness h;
    h.stop = true;
    Receiver rx = h.make();
    Summary s = rx.run(1000, h.stop);
    CHECK(s.state == SessionState::Aborted);
    CHECK(h.ticks == 0);
    CHECK(h.ch.grants.size() == 1);          // initial burst went out
    CHECK(h.ch.unsubscribes == 1);
}

TEST_CASE("Receiver refuses a declared size of zero") {
    Harness h;
    Receiver rx = h.make();
    Summary s = rx.run(0, h.stop);

    CHECK(s.state == SessionState::Aborted);
    CHECK(s.reason == ReasonStr("no file data"));
    CHECK(h.ch.grants.empty());
    CHECK(h.ticks == 0);
    CHECK(h.ch.unsubscribes == 1);
    CHECK(h.count(EventKind::Finished) == 1);
}

TEST_CASE("Session clock starts after the subscription is in place") {
    Harness h;
    h.ch.on_subscribe = [&h] {
        h.ch.deliver(data_frame(0));         // lands before start(): dropped
        h.now += 5000;
    };
    h.on_tick = [&h](int tick) { if (tick == 1) h.stop = true; };
    Receiver rx = h.make();
    Summary s = rx.run(1000, h.stop);

    CHECK(s.state == SessionState::Aborted);
    CHECK(s.reason == ReasonStr("interrupted"));
    CHECK(s.packets_seen == 0u);
    CHECK(s.bytes_received == 0u);
    CHECK(s.elapsed_ms == 500u);             // one sample interval, not 5.5 s
    REQUIRE(h.ch.grants.size() == 1);
    CHECK(h.ch.grants[0] == 64);
}
