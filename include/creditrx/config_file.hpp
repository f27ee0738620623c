/**
 * @file config_file.hpp
 * @brief JSON overrides for SessionConfig.
 *
 * File layout (every key optional, unknown keys rejected):
 * @code{.json}
 * {
 *   "reorder_cap": 100,
 *   "sample_interval_ms": 500,
 *   "stall_samples": 20,
 *   "accept_percent": 99,
 *   "stall_skip_max": 10,
 *   "large_gap": 50,
 *   "no_data_timeout_ms": 60000,
 *   "progress_interval_ms": 100,
 *   "flow": { "initial_credits": 64, "cadence_packets": 2,
 *             "cadence_credits": 2, "stall_credits": 32 }
 * }
 * @endcode
 *
 * Keys present override the values already in the config; absent keys leave
 * them alone, so a file only needs the keys it changes.
 */
#ifndef CREDITRX_CONFIG_FILE_HPP
#define CREDITRX_CONFIG_FILE_HPP

#include <string>
#include "nlohmann/json.hpp"
#include "creditrx/session_config.hpp"

namespace creditrx {

/**
 * @brief Apply the keys of @p j onto @p cfg.
 * @return false with @p err set on a type error, out-of-range value or unknown
 *         key. @p cfg is left untouched in that case.
 */
bool apply_config(const nlohmann::json& j, SessionConfig& cfg, std::string& err);

/// Read and apply a JSON file. Parse errors are reported through @p err.
bool load_config(const std::string& path, SessionConfig& cfg, std::string& err);

/// Full config as JSON, in the same layout load_config() reads.
nlohmann::json to_json(const SessionConfig& cfg);

} // namespace creditrx

#endif // CREDITRX_CONFIG_FILE_HPP
