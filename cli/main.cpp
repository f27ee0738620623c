/**
 * @file main.cpp
 * @brief creditrx-cli: download one file from a peripheral through a BLE serial bridge.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); session config is defaults overlaid by the JSON file.
 *  - Open the bridge TTY, read the file-info record, run one Receiver transfer.
 *  - Render session events (progress, warnings) and the final summary in
 *    pretty | json | raw form.
 *  - Save the bytes under a collision-safe name when the transfer succeeded.
 *
 * Notes:
 *  - Config file: --config PATH, else $XDG_CONFIG_HOME/creditrx/config.json
 *    (~/.config/creditrx/config.json) when it exists.
 *  - Ctrl-C sets a stop flag; the transfer ends as "aborted: interrupted" and
 *    the peripheral is still unsubscribed.
 *  - Exit: 0 complete or accepted, 1 timed out / aborted / I/O failure,
 *    2 usage or configuration error.
 */

#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "creditrx/config_file.hpp"
#include "creditrx/file_sink.hpp"
#include "creditrx/packet_codec.hpp"
#include "creditrx/receiver.hpp"
#include "creditrx/transport/serial_bridge.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace creditrx;

// ---------- small utilities ----------

static std::atomic<bool> g_stop{false};

static void on_sigint(int) { g_stop = true; }

static bool is_tty(FILE* f) { return ::isatty(fileno(f)); }

struct Ansi {
  bool enabled{true};
  std::string bold  (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim   (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red   (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string yellow(const std::string& s) const { return enabled ? "\033[33m"+s+"\033[0m" : s; }
  std::string green (const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
};

static fs::path default_config_path() {
  const char* xdg  = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg)
                : fs::path(home ? home : ".") / ".config";
  return base / "creditrx" / "config.json";
}

static std::string human_bytes(uint64_t n) {
  std::ostringstream os;
  os.setf(std::ios::fixed);
  os.precision(1);
  if (n >= 1024ull * 1024ull) os << (double)n / (1024.0 * 1024.0) << " MiB";
  else if (n >= 1024ull)      os << (double)n / 1024.0 << " KiB";
  else                        os << n << " B";
  return os.str();
}

static std::string percent(uint64_t bytes, uint64_t total) {
  if (total == 0) return "?%";
  uint64_t p = bytes * 100u / total;
  if (p > 100) p = 100;
  return std::to_string(p) + "%";
}

// ---------- event rendering ----------

static json event_json(const Event& e) {
  json j;
  j["event"] = to_string(e.kind);
  j["at_ms"] = e.at_ms;
  switch (e.kind) {
    case EventKind::Progress:
      j["bytes"] = e.bytes; j["total"] = e.total;
      j["expected_seq"] = e.seq; j["buffered"] = e.count;
      j["throughput_bps"] = e.throughput_bps;
      break;
    case EventKind::FrameMalformed:
      j["length"] = e.count; j["status"] = to_string(e.frame_status);
      break;
    case EventKind::ChecksumMismatch:
      j["seq"] = e.seq; j["computed"] = e.seq_to; j["header"] = e.count;
      break;
    case EventKind::BufferOverflowEviction:
      j["seq"] = e.seq; j["buffered"] = e.count;
      break;
    case EventKind::GapSkipped:
      j["from"] = e.seq; j["to"] = e.seq_to; j["lost"] = e.count;
      break;
    case EventKind::EndMarker:
      j["seq"] = e.seq;
      break;
    case EventKind::Stalled:
      j["expected_seq"] = e.seq; j["min_buffered"] = e.seq_to; j["buffered"] = e.count;
      j["bytes"] = e.bytes; j["total"] = e.total;
      break;
    case EventKind::TransportWriteFailed:
      j["credits"] = e.count;
      break;
    case EventKind::AcceptedIncomplete:
    case EventKind::TimedOut:
      j["bytes"] = e.bytes; j["total"] = e.total;
      break;
    case EventKind::Finished:
      j["packets"] = e.count; j["bytes"] = e.bytes;
      if (!e.reason.empty()) j["reason"] = e.reason.c_str();
      break;
  }
  return j;
}

// One line per event on stderr; progress rewrites itself on a terminal.
static void print_event_pretty(const Event& e, const Ansi& ansi, bool tty) {
  switch (e.kind) {
    case EventKind::Progress: {
      if (!tty) return;
      std::cerr << "\r  " << percent(e.bytes, e.total) << "  "
                << human_bytes(e.bytes) << " / " << human_bytes(e.total)
                << "  " << human_bytes(e.throughput_bps) << "/s"
                << "  " << ansi.dim("buffered " + std::to_string(e.count)) << "   " << std::flush;
      return;
    }
    case EventKind::FrameMalformed:
      std::cerr << "\n" << ansi.yellow("warn: ") << "malformed frame (" << e.count << " bytes, "
                << to_string(e.frame_status) << ")\n";
      return;
    case EventKind::ChecksumMismatch: {
      char buf[64];
      std::snprintf(buf, sizeof(buf), "header 0x%04X computed 0x%04X",
                    (unsigned)e.count, (unsigned)e.seq_to);
      std::cerr << "\n" << ansi.yellow("warn: ") << "checksum mismatch on seq " << e.seq
                << " (" << buf << "), payload kept\n";
      return;
    }
    case EventKind::BufferOverflowEviction:
      std::cerr << "\n" << ansi.yellow("warn: ") << "reorder buffer full, dropped seq " << e.seq << "\n";
      return;
    case EventKind::GapSkipped:
      std::cerr << "\n" << ansi.yellow("warn: ") << "skipped " << e.count
                << " missing packet(s), seq " << e.seq << " -> " << e.seq_to << "\n";
      return;
    case EventKind::EndMarker:
      std::cerr << "\n" << ansi.dim("end marker at seq " + std::to_string(e.seq)) << "\n";
      return;
    case EventKind::Stalled:
      std::cerr << "\n" << ansi.yellow("stalled ") << "at " << percent(e.bytes, e.total)
                << ", waiting on seq " << e.seq << " (" << e.count << " buffered)\n";
      return;
    case EventKind::AcceptedIncomplete:
      std::cerr << ansi.yellow("accepting ") << human_bytes(e.bytes) << " of "
                << human_bytes(e.total) << " as complete\n";
      return;
    case EventKind::TimedOut:
      std::cerr << "\n" << ansi.red("error: ") << "no data received, giving up\n";
      return;
    case EventKind::TransportWriteFailed:
      std::cerr << "\n" << ansi.yellow("warn: ") << "credit write failed (" << e.count << " credits)\n";
      return;
    case EventKind::Finished:
      if (tty) std::cerr << "\n";
      return;
  }
}

// ---------- summary rendering ----------

static json summary_json(const Summary& s, const std::string& name, const std::string& saved) {
  json j;
  j["state"]                = to_string(s.state);
  if (!s.reason.empty()) j["reason"] = s.reason.c_str();
  j["name"]                 = name;
  j["bytes_received"]       = s.bytes_received;
  j["total_bytes"]          = s.total_bytes;
  j["packets_seen"]         = s.packets_seen;
  j["buffered_remaining"]   = s.buffered_remaining;
  j["elapsed_ms"]           = s.elapsed_ms;
  j["throughput_bps"]       = s.throughput_bps;
  j["credits_issued"]       = s.credits_issued;
  j["credit_writes_failed"] = s.credit_writes_failed;
  j["checksum_mismatches"]  = s.checksum_mismatches;
  j["malformed_frames"]     = s.malformed_frames;
  j["evicted_packets"]      = s.evicted_packets;
  j["skipped_sequences"]    = s.skipped_sequences;
  j["stall_recoveries"]     = s.stall_recoveries;
  j["events_dropped"]       = s.events_dropped;
  if (s.end_marker_seen) j["end_marker_seq"] = s.end_marker_seq;
  if (!saved.empty()) j["saved"] = saved;
  return j;
}

static void print_summary_pretty(const Summary& s, const std::string& saved, const Ansi& ansi) {
  const std::string head = s.succeeded() ? ansi.green(to_string(s.state)) : ansi.red(to_string(s.state));
  std::cout << ansi.bold("transfer ") << head;
  if (!s.reason.empty()) std::cout << ": " << s.reason.c_str();
  std::cout << "\n";
  std::cout << "  bytes     " << s.bytes_received << " / " << s.total_bytes
            << " (" << percent(s.bytes_received, s.total_bytes) << ")\n";
  std::cout << "  packets   " << s.packets_seen << "\n";
  std::cout << "  elapsed   " << s.elapsed_ms << " ms, " << human_bytes(s.throughput_bps) << "/s\n";
  std::cout << "  credits   " << s.credits_issued << "\n";

  auto warn = [&](const char* what, uint64_t n) {
    if (n) std::cout << "  " << ansi.yellow("warn") << "      " << n << " " << what << "\n";
  };
  warn("packet(s) left in reorder buffer", s.buffered_remaining);
  warn("checksum mismatch(es)", s.checksum_mismatches);
  warn("malformed frame(s)", s.malformed_frames);
  warn("evicted packet(s)", s.evicted_packets);
  warn("sequence number(s) skipped", s.skipped_sequences);
  warn("failed credit write(s)", s.credit_writes_failed);
  warn("event(s) dropped from outbox", s.events_dropped);

  if (!saved.empty()) std::cout << "  saved     " << ansi.bold(saved) << "\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_dev;
  int         opt_baud = 115200;
  int         opt_boot_delay = 400;
  std::string opt_out_dir = ".";
  std::string opt_config;
  std::string opt_format = "pretty"; // pretty|json|raw
  bool        opt_no_color = false;
  bool        opt_info_only = false;
  bool        opt_print_config = false;

  CLI::App app{"creditrx: credit-paced file download over a BLE serial bridge"};

  app.add_option("--dev", opt_dev, "Bridge serial device (e.g. /dev/serial/by-id/...)");
  app.add_option("--baud", opt_baud, "Bridge baud rate")->capture_default_str()
     ->check(CLI::IsMember({9600, 19200, 38400, 57600, 115200, 230400}));
  app.add_option("--boot-delay", opt_boot_delay, "Settle time after opening the TTY (ms)")
     ->capture_default_str()->check(CLI::Range(0, 10000));
  app.add_option("--out-dir", opt_out_dir, "Directory for the downloaded file")->capture_default_str();
  app.add_option("--config", opt_config, "JSON config file with threshold overrides");
  app.add_option("--format", opt_format, "Output format: pretty|json|raw")
     ->check(CLI::IsMember({"pretty", "json", "raw"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_flag("--info-only", opt_info_only, "Read and print the file-info record, then exit");
  app.add_flag("--print-config", opt_print_config, "Print the effective config as JSON and exit");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty(stderr) && opt_format == "pretty";
  const bool tty_err = is_tty(stderr);

  // Config: defaults < file
  SessionConfig cfg;
  {
    std::string err;
    if (!opt_config.empty()) {
      if (!load_config(opt_config, cfg, err)) {
        std::cerr << ansi.red("error: ") << err << "\n";
        return 2;
      }
    } else {
      const fs::path def = default_config_path();
      std::error_code ec;
      if (fs::exists(def, ec) && !load_config(def.string(), cfg, err)) {
        std::cerr << ansi.red("error: ") << err << "\n";
        return 2;
      }
    }
  }

  if (opt_print_config) {
    std::cout << to_json(cfg).dump(2) << "\n";
    return 0;
  }

  if (opt_dev.empty()) {
    std::cerr << ansi.red("error: ") << "--dev is required\n";
    return 2;
  }

  transport::SerialBridgeConfig bcfg;
  bcfg.path          = opt_dev;
  bcfg.baud          = opt_baud;
  bcfg.boot_delay_ms = opt_boot_delay;
  transport::SerialBridge bridge(bcfg);

  if (!bridge.open()) {
    std::cerr << ansi.red("error: ") << "cannot open " << opt_dev << "\n";
    return 1;
  }

  std::vector<uint8_t> raw_info;
  FileInfo info;
  if (!bridge.read_file_info(raw_info) ||
      !parse_file_info(raw_info.data(), raw_info.size(), info)) {
    std::cerr << ansi.red("error: ") << "no valid file-info record from peripheral\n";
    return 1;
  }
  const std::string name = info.name.c_str();

  if (info.size == 0 && !opt_info_only) {
    std::cerr << ansi.red("error: ") << "peripheral reports no file data\n";
    return 1;
  }

  if (opt_info_only) {
    if (opt_format == "json") {
      json j; j["name"] = name; j["size"] = info.size;
      std::cout << j.dump() << "\n";
    } else if (opt_format == "raw") {
      std::cout << info.size << " " << name << "\n";
    } else {
      std::cout << ansi.bold(name.empty() ? std::string("(unnamed)") : name)
                << "  " << human_bytes(info.size) << " (" << info.size << " bytes)\n";
    }
    return 0;
  }

  if (opt_format == "pretty") {
    std::cerr << "receiving " << ansi.bold(name.empty() ? file_sink::FALLBACK_NAME : name)
              << " (" << human_bytes(info.size) << ") via " << bridge.name() << "\n";
  }

  std::signal(SIGINT, on_sigint);

  Receiver::EventSink sink;
  if (opt_format == "json") {
    sink = [](const Event& e) {
      if (e.kind == EventKind::Progress) return;             // summary carries the totals
      std::cerr << event_json(e).dump() << "\n";
    };
  } else if (opt_format == "pretty") {
    sink = [&ansi, tty_err](const Event& e) { print_event_pretty(e, ansi, tty_err); };
  }

  Receiver rx(bridge, cfg, sink);
  const Summary s = rx.run(info.size, g_stop);
  bridge.close();

  std::string saved;
  bool save_failed = false;
  if (s.succeeded()) {
    fs::path written;
    std::string err;
    if (file_sink::save(opt_out_dir, name, rx.take_data(), written, err)) {
      saved = written.string();
    } else {
      std::cerr << ansi.red("error: ") << err << "\n";
      save_failed = true;
    }
  }

  if (opt_format == "json") {
    std::cout << summary_json(s, name, saved).dump(2) << "\n";
  } else if (opt_format == "raw") {
    std::cout << to_string(s.state) << " " << s.bytes_received << " " << s.total_bytes;
    if (!saved.empty()) std::cout << " " << saved;
    std::cout << "\n";
  } else {
    Ansi out_ansi{!opt_no_color && is_tty(stdout)};
    print_summary_pretty(s, saved, out_ansi);
  }

  return (s.succeeded() && !save_failed) ? 0 : 1;
}
