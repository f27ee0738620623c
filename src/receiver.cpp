// -----------------------------------------------------------------------------
// receiver.cpp: driving loop around TransferSession
//
// Threading contract: see include/creditrx/receiver.hpp
// -----------------------------------------------------------------------------
#include "creditrx/receiver.hpp"

#include <chrono>
#include <thread>
#include <utility>

namespace creditrx {

uint64_t Receiver::steady_now_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

void Receiver::sleep_ms(uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

Receiver::Receiver(transport::IChannel& channel, const SessionConfig& cfg,
                   EventSink sink, Clock now, Sleeper sleep)
: channel_(channel), session_(cfg), sink_(std::move(sink)),
  now_(std::move(now)), sleep_(std::move(sleep)) {
}

// -----------------------------------------------------------------------------
// run()
// PRE:    channel is open; no other run() in progress.
// POLICY: the loop checks termination before sleeping, so a session that
//         finished inside the frame handler returns without an extra quantum.
// OUT:    final summary; assembled bytes stay in the session for take_data().
// -----------------------------------------------------------------------------
Summary Receiver::run(uint64_t total_bytes, const std::atomic<bool>& stop) {
  transport::Subscription sub(channel_, [this](const uint8_t* data, size_t len) {
    handle_frame(data, len);                  // ignored by the session until start()
  });

  uint8_t grant = 0;
  {
    std::lock_guard<std::mutex> lock(session_mtx_);
    grant = session_.start(total_bytes, now_());
  }

  if (!sub.active()) {
    abort("subscribe failed");
    drain_events();
    std::lock_guard<std::mutex> lock(session_mtx_);
    return session_.summary();
  }

  write_grant(grant);
  drain_events();

  const uint32_t interval = session_.config().sample_interval_ms;
  for (;;) {
    {
      std::lock_guard<std::mutex> lock(session_mtx_);
      if (session_.finished()) break;
    }
    if (stop.load()) { abort("interrupted"); break; }
    if (!channel_.connected()) { abort("disconnected"); break; }

    sleep_(interval);

    {
      std::lock_guard<std::mutex> lock(session_mtx_);
      grant = session_.sample(now_());
    }
    write_grant(grant);
    drain_events();
  }

  sub.release();
  drain_events();

  std::lock_guard<std::mutex> lock(session_mtx_);
  return session_.summary();
}

TransferProgress Receiver::progress() const {
  std::lock_guard<std::mutex> lock(session_mtx_);
  return session_.progress();
}

std::vector<uint8_t> Receiver::take_data() {
  std::lock_guard<std::mutex> lock(session_mtx_);
  return session_.take_data();
}

// ---------- private ----------

void Receiver::handle_frame(const uint8_t* data, size_t len) {
  uint8_t grant = 0;
  {
    std::lock_guard<std::mutex> lock(session_mtx_);
    grant = session_.on_frame(data, len, now_());
  }
  write_grant(grant);
  drain_events();
}

// Write outside the lock; the channel may take its own locks or block briefly.
void Receiver::write_grant(uint8_t credits) {
  if (credits == 0) return;
  const transport::TxResult r = channel_.write_credits(credits);
  std::lock_guard<std::mutex> lock(session_mtx_);
  session_.on_grant_written(credits, r == transport::TxResult::Ok, now_());
}

void Receiver::drain_events() {
  std::lock_guard<std::mutex> sink_lock(sink_mtx_);
  std::vector<Event> batch;
  {
    std::lock_guard<std::mutex> lock(session_mtx_);
    Event e;
    while (session_.get_event(e)) batch.push_back(e);
  }
  if (!sink_) return;
  for (const Event& e : batch) sink_(e);
}

void Receiver::abort(const char* reason) {
  std::lock_guard<std::mutex> lock(session_mtx_);
  session_.abort(reason, now_());
}

} // namespace creditrx
