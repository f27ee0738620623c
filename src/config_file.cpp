// -----------------------------------------------------------------------------
// config_file.cpp: SessionConfig <-> JSON
// -----------------------------------------------------------------------------
#include "creditrx/config_file.hpp"

#include <fstream>
#include <set>

using json = nlohmann::json;

namespace creditrx {

namespace {

// read_field()
// Absent key: true, dst unchanged. Present: must be an unsigned integer in
// [lo, hi]. The value is staged in a copy by the caller, so a failure midway
// never leaves a half-applied config.
template <typename T>
bool read_field(const json& j, const char* key, T& dst,
                uint64_t lo, uint64_t hi, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<int64_t>() >= 0)) {
    err = std::string(key) + ": expected a non-negative integer";
    return false;
  }
  const uint64_t v = it->get<uint64_t>();
  if (v < lo || v > hi) {
    err = std::string(key) + ": " + std::to_string(v) + " outside [" +
          std::to_string(lo) + ", " + std::to_string(hi) + "]";
    return false;
  }
  dst = static_cast<T>(v);
  return true;
}

bool check_keys(const json& j, const std::set<std::string>& allowed,
                const char* where, std::string& err) {
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (!allowed.count(it.key())) {
      err = std::string("unknown key '") + it.key() + "' in " + where;
      return false;
    }
  }
  return true;
}

} // namespace

bool apply_config(const json& j, SessionConfig& cfg, std::string& err) {
  if (!j.is_object()) {
    err = "config root must be an object";
    return false;
  }
  static const std::set<std::string> TOP = {
    "reorder_cap", "sample_interval_ms", "stall_samples", "accept_percent",
    "stall_skip_max", "large_gap", "no_data_timeout_ms", "progress_interval_ms", "flow"
  };
  static const std::set<std::string> FLOW = {
    "initial_credits", "cadence_packets", "cadence_credits", "stall_credits"
  };
  if (!check_keys(j, TOP, "config", err)) return false;

  SessionConfig c = cfg;
  const uint64_t U32 = 0xFFFFFFFFull;

  if (!read_field(j, "reorder_cap", c.reorder_cap,
                  ReorderBuffer::CAP_MIN, ReorderBuffer::CAP_CEILING, err)) return false;
  if (!read_field(j, "sample_interval_ms", c.sample_interval_ms, 1, 60000, err)) return false;
  if (!read_field(j, "stall_samples", c.stall_samples, 1, 0xFFFF, err)) return false;
  if (!read_field(j, "accept_percent", c.accept_percent, 1, 100, err)) return false;
  if (!read_field(j, "stall_skip_max", c.stall_skip_max, 0, U32, err)) return false;
  if (!read_field(j, "large_gap", c.large_gap, 1, U32, err)) return false;
  if (!read_field(j, "no_data_timeout_ms", c.no_data_timeout_ms, 1, U32, err)) return false;
  if (!read_field(j, "progress_interval_ms", c.progress_interval_ms, 0, U32, err)) return false;

  auto f = j.find("flow");
  if (f != j.end()) {
    if (!f->is_object()) {
      err = "flow: expected an object";
      return false;
    }
    if (!check_keys(*f, FLOW, "flow", err)) return false;
    if (!read_field(*f, "initial_credits", c.flow.initial_credits, 1, 255, err)) return false;
    if (!read_field(*f, "cadence_packets", c.flow.cadence_packets, 1, 255, err)) return false;
    if (!read_field(*f, "cadence_credits", c.flow.cadence_credits, 1, 255, err)) return false;
    if (!read_field(*f, "stall_credits", c.flow.stall_credits, 1, 255, err)) return false;
  }

  cfg = c;
  return true;
}

bool load_config(const std::string& path, SessionConfig& cfg, std::string& err) {
  std::ifstream in(path);
  if (!in) {
    err = "cannot open " + path;
    return false;
  }
  json j;
  try {
    in >> j;
  } catch (const json::exception& e) {
    err = path + ": " + e.what();
    return false;
  }
  if (!apply_config(j, cfg, err)) {
    err = path + ": " + err;
    return false;
  }
  return true;
}

json to_json(const SessionConfig& cfg) {
  json j;
  j["reorder_cap"]          = cfg.reorder_cap;
  j["sample_interval_ms"]   = cfg.sample_interval_ms;
  j["stall_samples"]        = cfg.stall_samples;
  j["accept_percent"]       = cfg.accept_percent;
  j["stall_skip_max"]       = cfg.stall_skip_max;
  j["large_gap"]            = cfg.large_gap;
  j["no_data_timeout_ms"]   = cfg.no_data_timeout_ms;
  j["progress_interval_ms"] = cfg.progress_interval_ms;
  j["flow"] = {
    {"initial_credits", cfg.flow.initial_credits},
    {"cadence_packets", cfg.flow.cadence_packets},
    {"cadence_credits", cfg.flow.cadence_credits},
    {"stall_credits",   cfg.flow.stall_credits}
  };
  return j;
}

} // namespace creditrx
