/**
 * @file session_config.hpp
 * @brief Tunable thresholds of a transfer session, with the protocol defaults.
 *
 * @details
 * Every number here encodes part of the implicit contract with the sender
 * firmware or the recovery behaviour users have come to expect. Defaults match
 * the deployed receivers; override them through the JSON config file or CLI
 * flags (see config_file.hpp), not by editing call sites.
 */
#ifndef CREDITRX_SESSION_CONFIG_HPP
#define CREDITRX_SESSION_CONFIG_HPP

#include <stdint.h>
#include "creditrx/flow_controller.hpp"
#include "creditrx/reorder_buffer.hpp"

namespace creditrx {

struct SessionConfig {
  /// @name Defaults
  ///@{
  static constexpr uint32_t SAMPLE_INTERVAL_MS_DEFAULT   = 500;    ///< Driving-loop quantum.
  static constexpr uint16_t STALL_SAMPLES_DEFAULT        = 20;     ///< Flat samples before a stall (~10 s).
  static constexpr uint8_t  ACCEPT_PERCENT_DEFAULT       = 99;     ///< Stalled at/above this % counts as done.
  static constexpr uint32_t STALL_SKIP_MAX_DEFAULT       = 10;     ///< Largest gap a stall may skip.
  static constexpr uint32_t LARGE_GAP_DEFAULT            = 50;     ///< Out-of-order distance that forces a skip.
  static constexpr uint32_t NO_DATA_TIMEOUT_MS_DEFAULT   = 60000;  ///< Hard deadline for the first byte.
  static constexpr uint32_t PROGRESS_INTERVAL_MS_DEFAULT = 100;    ///< Progress event throttle.
  ///@}

  FlowPolicy flow{};                                            ///< Credit cadence.
  uint16_t   reorder_cap{ReorderBuffer::CAP_DEFAULT};          ///< Reorder buffer entry cap.
  uint32_t   sample_interval_ms{SAMPLE_INTERVAL_MS_DEFAULT};
  uint16_t   stall_samples{STALL_SAMPLES_DEFAULT};
  uint8_t    accept_percent{ACCEPT_PERCENT_DEFAULT};
  uint32_t   stall_skip_max{STALL_SKIP_MAX_DEFAULT};
  uint32_t   large_gap{LARGE_GAP_DEFAULT};
  uint32_t   no_data_timeout_ms{NO_DATA_TIMEOUT_MS_DEFAULT};
  uint32_t   progress_interval_ms{PROGRESS_INTERVAL_MS_DEFAULT};
};

} // namespace creditrx

#endif // CREDITRX_SESSION_CONFIG_HPP
