// -----------------------------------------------------------------------------
// flow_controller.cpp: credit cadence bookkeeping
//
// API: include/creditrx/flow_controller.hpp
// -----------------------------------------------------------------------------
#include "creditrx/flow_controller.hpp"

namespace creditrx {

FlowController::FlowController(const FlowPolicy& policy)
: policy_(policy) {
}

uint8_t FlowController::on_packet_consumed() {
  ++consumed_;
  const uint8_t every = policy_.cadence_packets ? policy_.cadence_packets : 1;  // 0 would never fire
  if (consumed_ % every != 0) return 0;
  return policy_.cadence_credits;
}

bool FlowController::record(uint8_t credits, bool written_ok) {
  if (written_ok) {
    credits_issued_ += credits;    // only what actually left the host counts
    ++grants_ok_;
  } else {
    ++grants_failed_;
  }
  return written_ok;
}

void FlowController::reset() {
  consumed_       = 0;
  credits_issued_ = 0;
  grants_ok_      = 0;
  grants_failed_  = 0;
}

} // namespace creditrx
