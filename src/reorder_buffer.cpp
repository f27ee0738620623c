// -----------------------------------------------------------------------------
// reorder_buffer.cpp: sequence-ordered reassembly with bounded storage
//
// API & invariants:
//   see include/creditrx/reorder_buffer.hpp
//
// Tests:
//   see tests/test_reorder_buffer.cpp
// -----------------------------------------------------------------------------
#include "creditrx/reorder_buffer.hpp"

namespace creditrx {

const char* to_string(AdmitStatus s) {
  switch (s) {
    case AdmitStatus::Stale:     return "stale";
    case AdmitStatus::Flushed:   return "flushed";
    case AdmitStatus::Buffered:  return "buffered";
    case AdmitStatus::Duplicate: return "duplicate";
  }
  return "unknown";
}

ReorderBuffer::ReorderBuffer(size_t cap) {
  set_cap(cap);
}

void ReorderBuffer::set_cap(size_t cap) {
  if (cap < CAP_MIN)     cap = CAP_MIN;       // eviction to cap/2 must keep one slot
  if (cap > CAP_CEILING) cap = CAP_CEILING;   // storage is fixed at compile time
  cap_ = cap;                                 // takes effect on the next admit()
}

void ReorderBuffer::reset() {
  entries_.clear();                           // drop every held payload
  expected_ = 0;                              // streams always start at sequence 0
}

void ReorderBuffer::append(std::vector<uint8_t>& out, const Payload& payload) {
  out.insert(out.end(), payload.begin(), payload.end());   // payload bytes only, no header
}

// -----------------------------------------------------------------------------
// admit()
// PRE:    every stored key > expected_ (class invariant).
// POLICY:
//   - stale and duplicate packets are no-ops; the caller still counts them.
//   - in-order packets bypass the map entirely.
//   - overflow evicts from the low end, down to cap/2, and lists every key.
// -----------------------------------------------------------------------------
ReorderBuffer::AdmitResult ReorderBuffer::admit(uint32_t seq, const Payload& payload,
                                                std::vector<uint8_t>& out) {
  AdmitResult r;

  // PRE: already delivered or skipped past
  if (seq < expected_) {
    r.status = AdmitStatus::Stale;
    return r;
  }

  // POLICY: the packet we are waiting for goes straight out
  if (seq == expected_) {
    append(out, payload);
    ++expected_;                         // next hole
    r.flushed = 1 + drain_into(out);     // cascade any run that is now contiguous
    r.status  = AdmitStatus::Flushed;
    return r;
  }

  // POLICY: first copy wins; a repeat never replaces stored bytes
  if (contains(seq)) {
    r.status = AdmitStatus::Duplicate;
    return r;
  }

  entries_.insert(Map::value_type(seq, payload));   // hold until the gap below fills
  r.status = AdmitStatus::Buffered;

  if (entries_.size() > cap_) evict_overflow(r.evicted);   // may remove `seq` itself
  return r;
}

size_t ReorderBuffer::drain_into(std::vector<uint8_t>& out) {
  size_t n = 0;
  Map::iterator it = entries_.find(expected_);
  while (it != entries_.end()) {         // stop at the first hole
    append(out, it->second);
    entries_.erase(it);                  // delivered: no longer held
    ++expected_;
    ++n;
    it = entries_.find(expected_);
  }
  return n;                              // packets moved to `out`
}

void ReorderBuffer::evict_overflow(EvictedList& evicted) {
  const size_t keep = cap_ / 2;            // hysteresis: no evict on every admit
  while (entries_.size() > keep) {
    Map::iterator lowest = entries_.begin();   // etl::map is ordered by key
    evicted.push_back(lowest->first);    // reported by the session, one event each
    entries_.erase(lowest);
  }
}

// -----------------------------------------------------------------------------
// skip_to()
// POLICY:
//   - forward only; a target <= expected_ is refused so a late or repeated
//     recovery decision can never rewind the stream.
//   - anything buffered below the target is unreachable after the move and is
//     dropped here to keep the "no key below expected" invariant.
// -----------------------------------------------------------------------------
ReorderBuffer::SkipResult ReorderBuffer::skip_to(uint32_t target, std::vector<uint8_t>& out) {
  SkipResult r;
  r.from = expected_;
  r.to   = expected_;
  if (target <= expected_) return r;     // refused: moved stays false

  while (!entries_.empty() && entries_.begin()->first < target) {
    entries_.erase(entries_.begin());    // below the new floor: unreachable
    ++r.discarded;
  }

  expected_ = target;                    // the hole [from, to) is given up
  r.moved   = true;
  r.to      = target;
  r.flushed = drain_into(out);           // target itself is usually buffered
  return r;
}

bool ReorderBuffer::min_buffered(uint32_t& seq) const {
  if (entries_.empty()) return false;
  seq = entries_.begin()->first;
  return true;
}

bool ReorderBuffer::lowest_at_or_above(uint32_t floor, uint32_t& seq) const {
  Map::const_iterator it = entries_.lower_bound(floor);   // first key >= floor
  if (it == entries_.end()) return false;
  seq = it->first;
  return true;
}

} // namespace creditrx
