/**
 * @file reorder_buffer.hpp
 * @brief Bounded out-of-order packet store that releases payloads in sequence order.
 *
 * @details
 * The notification channel delivers packets in any order, sometimes twice, and
 * sometimes never. `ReorderBuffer` turns that into one ordered byte stream:
 *
 * ```
 *   admit(seq, payload, out)
 *      seq <  expected  -> Stale      (dropped, nothing changes)
 *      seq == expected  -> Flushed    (append, ++expected, cascade drain)
 *      seq >  expected  -> Buffered   (stored by seq; may trigger eviction)
 *                       -> Duplicate  (seq already stored; no-op)
 * ```
 *
 * @par Invariants
 * - No stored key is ever below `expected_seq()`.
 * - `size() <= cap()` after every call returns.
 * - `expected_seq()` only moves forward.
 *
 * @par Memory bound
 * Storage is an `etl::map` with a compile-time ceiling (`CAP_CEILING`). The
 * runtime cap (`set_cap()`) sits at or below it. When an insert pushes the size
 * past the cap, the lowest keys are evicted until at most `cap / 2` remain, and
 * each evicted sequence number is listed in the admit result so the caller can
 * report it. Nothing is dropped quietly.
 *
 * @par Gap policy
 * The buffer never skips a hole on its own. Callers inspect `min_buffered()` /
 * `lowest_at_or_above()` and decide when to call `skip_to()`.
 */
#ifndef CREDITRX_REORDER_BUFFER_HPP
#define CREDITRX_REORDER_BUFFER_HPP

#include <stddef.h>
#include <stdint.h>
#include <vector>
#include "etl/map.h"
#include "etl/vector.h"
#include "creditrx/packet_codec.hpp"

namespace creditrx {

/// What admit() did with a packet.
enum class AdmitStatus : uint8_t {
  Stale     = 0,  ///< seq < expected_seq; discarded.
  Flushed   = 1,  ///< seq == expected_seq; appended (plus any cascade).
  Buffered  = 2,  ///< seq > expected_seq; stored.
  Duplicate = 3   ///< seq > expected_seq and already stored; no-op.
};

const char* to_string(AdmitStatus s);

class ReorderBuffer {
public:
  /// Hard storage ceiling (entries). The runtime cap can be lowered, never raised past this.
  static constexpr size_t CAP_CEILING = 128;

  /// Default runtime cap.
  static constexpr size_t CAP_DEFAULT = 100;

  /// Smallest runtime cap accepted by set_cap().
  static constexpr size_t CAP_MIN     = 2;

  /// Sequence numbers evicted by one admit() call.
  using EvictedList = etl::vector<uint32_t, CAP_CEILING>;

  struct AdmitResult {
    AdmitStatus status{AdmitStatus::Stale};
    size_t      flushed{0};   ///< Packets appended to the output by this call.
    EvictedList evicted;      ///< Keys dropped by overflow eviction, lowest first.
  };

  struct SkipResult {
    bool     moved{false};    ///< False when the target was not ahead of expected_seq.
    uint32_t from{0};         ///< expected_seq before the skip.
    uint32_t to{0};           ///< expected_seq right after the skip (before draining).
    size_t   discarded{0};    ///< Buffered entries below the target that were thrown away.
    size_t   flushed{0};      ///< Packets drained after the skip.
  };

  explicit ReorderBuffer(size_t cap = CAP_DEFAULT);

  /**
   * @brief Offer one packet payload to the buffer.
   *
   * @param seq     Packet sequence number.
   * @param payload Packet payload.
   * @param out     Output stream; in-order payloads are appended here.
   * @return What happened, how many packets were flushed, and any evictions.
   */
  AdmitResult admit(uint32_t seq, const Payload& payload, std::vector<uint8_t>& out);

  /**
   * @brief Append every buffered payload that is now contiguous with expected_seq().
   * @return Number of packets appended.
   */
  size_t drain_into(std::vector<uint8_t>& out);

  /**
   * @brief Force expected_seq() forward to @p target and drain.
   *
   * Entries below @p target are discarded and counted. A target at or behind
   * expected_seq() is refused (`moved == false`, nothing changes).
   */
  SkipResult skip_to(uint32_t target, std::vector<uint8_t>& out);

  /// Lowest stored key. Returns false when empty.
  bool min_buffered(uint32_t& seq) const;

  /// Lowest stored key that is >= @p floor. Returns false if none.
  bool lowest_at_or_above(uint32_t floor, uint32_t& seq) const;

  bool contains(uint32_t seq) const { return entries_.find(seq) != entries_.end(); }

  uint32_t expected_seq() const { return expected_; }
  size_t   size() const         { return entries_.size(); }
  bool     empty() const        { return entries_.empty(); }
  size_t   cap() const          { return cap_; }

  /// Change the runtime cap; clamped to [CAP_MIN, CAP_CEILING]. Does not evict by itself.
  void set_cap(size_t cap);

  /// Forget everything and expect sequence 0 again. The cap is kept.
  void reset();

private:
  using Map = etl::map<uint32_t, Payload, CAP_CEILING + 1>;

  static void append(std::vector<uint8_t>& out, const Payload& payload);
  void evict_overflow(EvictedList& evicted);

  Map      entries_;
  uint32_t expected_{0};
  size_t   cap_{CAP_DEFAULT};
};

} // namespace creditrx

#endif // CREDITRX_REORDER_BUFFER_HPP
