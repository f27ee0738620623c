// -----------------------------------------------------------------------------
// session.cpp: Implementation of creditrx::TransferSession
//
// API, state diagram & failure model:
//   see include/creditrx/session.hpp
//
// Scenario tests:
//   see tests/test_session.cpp
//
// NOTE: This file is about *how* the rules are applied and in which order.
// The rules themselves (thresholds, contracts) are documented in the headers.
// -----------------------------------------------------------------------------
#include "creditrx/session.hpp"

namespace creditrx {

const char* to_string(EventKind k) {
  switch (k) {
    case EventKind::Progress:               return "progress";
    case EventKind::FrameMalformed:         return "frame-malformed";
    case EventKind::ChecksumMismatch:       return "checksum-mismatch";
    case EventKind::BufferOverflowEviction: return "buffer-overflow-eviction";
    case EventKind::GapSkipped:             return "gap-skipped";
    case EventKind::EndMarker:              return "end-marker";
    case EventKind::Stalled:                return "stalled";
    case EventKind::AcceptedIncomplete:     return "accepted-incomplete";
    case EventKind::TimedOut:               return "timed-out";
    case EventKind::TransportWriteFailed:   return "transport-write-failed";
    case EventKind::Finished:               return "finished";
  }
  return "unknown";
}

const char* to_string(SessionState s) {
  switch (s) {
    case SessionState::Idle:               return "idle";
    case SessionState::Subscribed:         return "subscribed";
    case SessionState::Downloading:        return "downloading";
    case SessionState::Stalled:            return "stalled";
    case SessionState::Complete:           return "complete";
    case SessionState::AcceptedIncomplete: return "accepted-incomplete";
    case SessionState::TimedOut:           return "timed-out";
    case SessionState::Aborted:            return "aborted";
  }
  return "unknown";
}

bool is_terminal(SessionState s) {
  return s == SessionState::Complete || s == SessionState::AcceptedIncomplete ||
         s == SessionState::TimedOut || s == SessionState::Aborted;
}

// ---------- public ----------

TransferSession::TransferSession(const SessionConfig& cfg)
: cfg_(cfg), reorder_(cfg.reorder_cap), flow_(cfg.flow) {
}

// start(): wipe everything from a previous run; no state crosses sessions.
uint8_t TransferSession::start(uint64_t total_bytes, uint64_t now_ms) {
  reorder_.reset();                        // expected_seq back to 0
  reorder_.set_cap(cfg_.reorder_cap);
  flow_.set_policy(cfg_.flow);
  flow_.reset();                           // cadence and credit counters
  output_.clear();
  outbox_.clear();                         // undrained events of the last run are lost

  total_bytes_        = total_bytes;
  packets_seen_       = 0;
  complete_           = false;
  end_seq_            = 0;
  start_ms_           = now_ms;
  finish_ms_          = now_ms;
  last_progress_ms_   = now_ms;
  progress_sent_      = false;
  last_sampled_bytes_ = 0;
  flat_samples_       = 0;

  checksum_mismatches_ = 0;
  malformed_frames_    = 0;
  evicted_packets_     = 0;
  skipped_sequences_   = 0;
  stall_recoveries_    = 0;
  events_dropped_      = 0;
  reason_.clear();

  state_ = SessionState::Subscribed;       // wrapper has just subscribed
  if (total_bytes == 0) {                  // nothing to fetch; never completes by size
    reason_.assign("no file data");
    finish(SessionState::Aborted, now_ms);
    return 0;
  }
  return flow_.initial_grant();            // the opening credit burst
}

// -----------------------------------------------------------------------------
// on_frame(): transport path.
// PRE:    caller serializes with sample() (single writer at a time).
// POLICY:
//   - malformed frames touch nothing but their own counter.
//   - the end marker only raises `complete_`; sample() owns the transition.
//   - every valid data packet (stale/duplicate included) advances the credit
//     cadence: the sender spent a credit on it either way.
// OUT:    credit grant, 0 when none is due.
// -----------------------------------------------------------------------------
uint8_t TransferSession::on_frame(const uint8_t* frame, size_t len, uint64_t now_ms) {
  if (state_ == SessionState::Idle || finished()) return 0;   // PRE: live session only
  enter_downloading();                     // first frame of any kind counts as traffic

  ParseResult r = parse_packet(frame, len);   // pure: never touches session state

  if (r.status == FrameStatus::EndMarker) {
    if (!complete_) {                      // repeats of the marker are silent
      complete_ = true;
      end_seq_  = r.packet.sequence;         // one past the last data packet
      Event e = make_event(EventKind::EndMarker, now_ms);
      e.seq = end_seq_;
      push_event(e);
    }
    return 0;                              // markers carry no credit
  }

  // DROP: short, overlong or length-mismatched frames
  if (r.status != FrameStatus::Ok) {
    ++malformed_frames_;
    Event e = make_event(EventKind::FrameMalformed, now_ms);
    e.count        = len;                  // raw frame length
    e.frame_status = r.status;
    push_event(e);
    return 0;
  }

  handle_data(r.packet, now_ms);           // reorder, evict, large-gap skip
  const uint8_t grant = flow_.on_packet_consumed();   // every Nth packet
  maybe_progress(now_ms);
  return grant;
}

// -----------------------------------------------------------------------------
// sample(): driving-loop path. Order matters:
//   1) completion (end marker seen, or every declared byte present)
//   2) stall accounting; near-complete stalls are accepted as done
//   3) hard no-data timeout
// -----------------------------------------------------------------------------
uint8_t TransferSession::sample(uint64_t now_ms) {
  if (state_ == SessionState::Idle || finished()) return 0;   // PRE: live session only
  enter_downloading();

  const uint64_t bytes = output_.size();   // contiguous bytes only; buffered ones don't count

  // 1) completion
  if (complete_ || (total_bytes_ > 0 && bytes >= total_bytes_)) {
    finish(SessionState::Complete, now_ms);
    return 0;
  }

  // 2) stall accounting
  uint8_t grant = 0;
  if (bytes == last_sampled_bytes_) {
    const uint16_t limit = cfg_.stall_samples ? cfg_.stall_samples : 1;   // 0 means every flat sample
    if (++flat_samples_ >= limit) {
      state_ = SessionState::Stalled;      // transient unless accepted below
      Event e = make_event(EventKind::Stalled, now_ms);
      e.seq   = reorder_.expected_seq();     // the hole we are stuck on
      e.count = reorder_.size();
      uint32_t lowest = 0;
      if (reorder_.min_buffered(lowest)) e.seq_to = lowest;   // first packet past the hole
      push_event(e);

      if (near_complete()) {
        push_event(make_event(EventKind::AcceptedIncomplete, now_ms));
        finish(SessionState::AcceptedIncomplete, now_ms);
        return 0;
      }

      grant = flow_.on_stall();            // top-up in case credits were lost
      flat_samples_ = 0;                   // next stall needs a full window again
      recover_stall(now_ms);
      state_ = SessionState::Downloading;
    }
  } else {
    flat_samples_       = 0;               // progress resets the window
    last_sampled_bytes_ = bytes;
  }

  // 3) timeout: only while nothing at all has been assembled
  if (bytes == 0 && now_ms - start_ms_ > cfg_.no_data_timeout_ms) {
    push_event(make_event(EventKind::TimedOut, now_ms));
    finish(SessionState::TimedOut, now_ms);
    return 0;
  }

  return grant;
}

void TransferSession::on_grant_written(uint8_t credits, bool ok, uint64_t now_ms) {
  if (credits == 0) return;                // nothing was written
  if (!flow_.record(credits, ok)) {        // failed grants are not counted as issued
    Event e = make_event(EventKind::TransportWriteFailed, now_ms);
    e.count = credits;
    push_event(e);
  }
}

void TransferSession::abort(const char* reason, uint64_t now_ms) {
  if (finished()) return;                  // first terminal state wins
  reason_.clear();
  if (reason) reason_.assign(reason);     // etl::string truncates to capacity
  finish(SessionState::Aborted, now_ms);
}

bool TransferSession::get_event(Event& out) {
  if (outbox_.empty()) return false;
  out = outbox_.front();                   // oldest first
  outbox_.pop_front();
  return true;
}

TransferProgress TransferSession::progress() const {
  TransferProgress p;
  p.expected_seq   = reorder_.expected_seq();
  p.bytes_received = output_.size();
  p.total_bytes    = total_bytes_;
  p.packets_seen   = packets_seen_;
  p.buffered_count = reorder_.size();
  p.complete       = complete_;
  return p;
}

Summary TransferSession::summary() const {
  Summary s;
  s.state                = state_;
  s.reason               = reason_;
  s.bytes_received       = output_.size();
  s.total_bytes          = total_bytes_;
  s.packets_seen         = packets_seen_;
  s.buffered_remaining   = reorder_.size();
  s.elapsed_ms           = finish_ms_ - start_ms_;
  s.throughput_bps       = throughput(finish_ms_);
  s.credits_issued       = flow_.credits_issued();
  s.credit_writes_failed = flow_.grants_failed();
  s.checksum_mismatches  = checksum_mismatches_;
  s.malformed_frames     = malformed_frames_;
  s.evicted_packets      = evicted_packets_;
  s.skipped_sequences    = skipped_sequences_;
  s.stall_recoveries     = stall_recoveries_;
  s.events_dropped       = events_dropped_;
  s.end_marker_seen      = complete_;
  s.end_marker_seq       = end_seq_;
  return s;
}

std::vector<uint8_t> TransferSession::take_data() {
  std::vector<uint8_t> out;
  out.swap(output_);                       // leaves the session empty
  return out;
}

// ---------- private: packet path ----------

void TransferSession::enter_downloading() {
  if (state_ == SessionState::Subscribed) state_ = SessionState::Downloading;
}

void TransferSession::handle_data(const Packet& p, uint64_t now_ms) {
  ++packets_seen_;                         // stale and duplicate included

  if (!p.checksum_ok) {
    ++checksum_mismatches_;                 // kept anyway: no retransmission exists
    Event e = make_event(EventKind::ChecksumMismatch, now_ms);
    e.seq    = p.sequence;
    e.seq_to = p.computed;                 // what we computed
    e.count  = p.checksum;                 // what the header claimed
    push_event(e);
  }

  ReorderBuffer::AdmitResult a = reorder_.admit(p.sequence, p.payload, output_);

  for (size_t i = 0; i < a.evicted.size(); ++i) {
    ++evicted_packets_;
    Event e = make_event(EventKind::BufferOverflowEviction, now_ms);
    e.seq   = a.evicted[i];
    e.count = reorder_.size();             // occupancy after eviction
    push_event(e);
  }

  // POLICY: a far-ahead packet gives up on the hole below it
  if (a.status == AdmitStatus::Buffered &&
      p.sequence - reorder_.expected_seq() > cfg_.large_gap) {
    recover_large_gap(now_ms);
  }
}

// recover_large_gap(): a packet this far ahead means the hole is not coming back.
void TransferSession::recover_large_gap(uint64_t now_ms) {
  uint32_t target = 0;
  if (!reorder_.lowest_at_or_above(reorder_.expected_seq(), target)) return;
  report_skip(reorder_.skip_to(target, output_), now_ms);
}

// recover_stall(): after the extra credits, close a small hole if one is blocking.
void TransferSession::recover_stall(uint64_t now_ms) {
  ++stall_recoveries_;
  uint32_t lowest = 0;
  if (!reorder_.min_buffered(lowest)) return;                            // nothing past the hole
  if (lowest - reorder_.expected_seq() > cfg_.stall_skip_max) return;    // too large: keep waiting
  report_skip(reorder_.skip_to(lowest, output_), now_ms);
}

void TransferSession::report_skip(const ReorderBuffer::SkipResult& r, uint64_t now_ms) {
  if (!r.moved) return;                    // refused skip: nothing to report
  const uint64_t lost = static_cast<uint64_t>(r.to) - r.from;   // sequences given up
  skipped_sequences_ += lost;
  Event e = make_event(EventKind::GapSkipped, now_ms);
  e.seq    = r.from;
  e.seq_to = r.to;
  e.count  = lost;
  push_event(e);
}

void TransferSession::maybe_progress(uint64_t now_ms) {
  if (progress_sent_ && now_ms - last_progress_ms_ < cfg_.progress_interval_ms) return;
  progress_sent_    = true;               // first one always goes out
  last_progress_ms_ = now_ms;

  Event e = make_event(EventKind::Progress, now_ms);
  e.seq            = reorder_.expected_seq();
  e.count          = reorder_.size();
  e.throughput_bps = throughput(now_ms);
  push_event(e);
}

void TransferSession::finish(SessionState terminal, uint64_t now_ms) {
  state_     = terminal;                  // no way back out
  finish_ms_ = now_ms;                    // freezes elapsed_ms and throughput

  Event e = make_event(EventKind::Finished, now_ms);
  e.count          = packets_seen_;
  e.throughput_bps = throughput(now_ms);
  e.reason         = reason_;
  push_event(e);
}

// ---------- private: helpers ----------

void TransferSession::push_event(const Event& e) {
  if (outbox_.full()) {                    // keep the newest; summary counters stay exact
    outbox_.pop_front();
    ++events_dropped_;
  }
  outbox_.push_back(e);
}

Event TransferSession::make_event(EventKind k, uint64_t now_ms) const {
  Event e;
  e.kind  = k;
  e.at_ms = now_ms - start_ms_;            // relative to start()
  e.bytes = output_.size();
  e.total = total_bytes_;
  return e;
}

uint32_t TransferSession::throughput(uint64_t now_ms) const {
  const uint64_t elapsed = now_ms - start_ms_;
  if (elapsed == 0) return 0;              // same-millisecond finish
  const uint64_t bps = static_cast<uint64_t>(output_.size()) * 1000u / elapsed;
  return bps > 0xFFFFFFFFull ? 0xFFFFFFFFu : static_cast<uint32_t>(bps);
}

bool TransferSession::near_complete() const {
  if (total_bytes_ == 0) return false;     // start() never leaves a live session at 0
  return static_cast<uint64_t>(output_.size()) * 100u >=
         total_bytes_ * static_cast<uint64_t>(cfg_.accept_percent);
}

} // namespace creditrx
