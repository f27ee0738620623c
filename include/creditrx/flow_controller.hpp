/**
 * @file flow_controller.hpp
 * @brief Credit issuance policy for pacing the peripheral.
 *
 * @details
 * The peripheral sends at most one data packet per credit it holds. The
 * receiver hands out credits through a one-byte control write:
 *
 * - a burst at session start (`initial_credits`, default 64),
 * - a steady trickle while packets arrive (`cadence_credits` every
 *   `cadence_packets` consumed packets, default 2 every 2),
 * - a top-up when the session detects a stall (`stall_credits`, default 32).
 *
 * These defaults are the sender's side of the contract. Change them only
 * together with the firmware.
 *
 * `FlowController` only decides. It never writes: the caller performs the
 * fire-and-forget write and reports back through `record()`, so a slow or
 * failing control path can never stall packet handling.
 */
#ifndef CREDITRX_FLOW_CONTROLLER_HPP
#define CREDITRX_FLOW_CONTROLLER_HPP

#include <stdint.h>

namespace creditrx {

/// Credit policy knobs. Values are bytes on the wire, hence uint8_t.
struct FlowPolicy {
  static constexpr uint8_t INITIAL_CREDITS_DEFAULT = 64;
  static constexpr uint8_t CADENCE_PACKETS_DEFAULT = 2;
  static constexpr uint8_t CADENCE_CREDITS_DEFAULT = 2;
  static constexpr uint8_t STALL_CREDITS_DEFAULT   = 32;

  uint8_t initial_credits{INITIAL_CREDITS_DEFAULT}; ///< Burst granted at start.
  uint8_t cadence_packets{CADENCE_PACKETS_DEFAULT}; ///< Grant after this many consumed packets.
  uint8_t cadence_credits{CADENCE_CREDITS_DEFAULT}; ///< Credits per cadence grant.
  uint8_t stall_credits{STALL_CREDITS_DEFAULT};     ///< Extra credits on stall.
};

class FlowController {
public:
  explicit FlowController(const FlowPolicy& policy = FlowPolicy{});

  /// Credits to grant when the session starts.
  uint8_t initial_grant() const { return policy_.initial_credits; }

  /**
   * @brief Count one consumed data packet.
   * @return Credits to grant now, or 0 when the cadence is not due.
   */
  uint8_t on_packet_consumed();

  /// Credits to grant because the transfer stalled (independent of cadence).
  uint8_t on_stall() const { return policy_.stall_credits; }

  /**
   * @brief Record the fate of one grant write.
   *
   * @param credits    Credits carried by the write.
   * @param written_ok Whether the transport accepted the write.
   * @return @p written_ok, for call-site chaining.
   */
  bool record(uint8_t credits, bool written_ok);

  uint64_t credits_issued() const   { return credits_issued_; }
  uint64_t packets_consumed() const { return consumed_; }
  uint32_t grants_ok() const        { return grants_ok_; }
  uint32_t grants_failed() const    { return grants_failed_; }

  const FlowPolicy& policy() const { return policy_; }
  void set_policy(const FlowPolicy& policy) { policy_ = policy; }

  /// Zero every counter; the policy is kept.
  void reset();

private:
  FlowPolicy policy_;
  uint64_t   consumed_{0};
  uint64_t   credits_issued_{0};
  uint32_t   grants_ok_{0};
  uint32_t   grants_failed_{0};
};

} // namespace creditrx

#endif // CREDITRX_FLOW_CONTROLLER_HPP
