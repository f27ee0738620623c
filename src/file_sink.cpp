// -----------------------------------------------------------------------------
// file_sink.cpp: collision-safe persistence of a finished transfer
// -----------------------------------------------------------------------------
#include "creditrx/file_sink.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace creditrx::file_sink {

std::string sanitize_name(const std::string& name) {
  // Treat both separators as path breaks; peripherals are not always POSIX.
  std::string s = name;
  for (char& c : s) if (c == '\\') c = '/';
  const fs::path leaf = fs::path(s).filename();
  const std::string out = leaf.string();
  if (out.empty() || out == "." || out == "..") return FALLBACK_NAME;
  return out;
}

fs::path unique_path(const fs::path& dir, const std::string& name, std::error_code& ec) {
  const std::string clean = sanitize_name(name);
  fs::path candidate = dir / clean;
  ec.clear();
  if (!fs::exists(candidate, ec)) return ec ? fs::path() : candidate;

  const fs::path p(clean);
  const std::string stem = p.stem().string();
  const std::string ext  = p.extension().string();
  for (unsigned n = 1;; ++n) {
    candidate = dir / (stem + "_" + std::to_string(n) + ext);
    if (!fs::exists(candidate, ec)) return ec ? fs::path() : candidate;
  }
}

bool save(const fs::path& dir, const std::string& name,
          const std::vector<uint8_t>& data,
          fs::path& written, std::string& err) {
  std::error_code ec;
  if (!dir.empty()) {
    fs::create_directories(dir, ec);
    if (ec) {
      err = "cannot create " + dir.string() + ": " + ec.message();
      return false;
    }
  }

  const fs::path target = unique_path(dir, name, ec);
  if (ec) {                                 // existence unknown: do not truncate
    err = "cannot check " + (dir / sanitize_name(name)).string() + ": " + ec.message();
    return false;
  }
  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if (!out) {
    err = "cannot open " + target.string() + " for writing";
    return false;
  }
  if (!data.empty()) {
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
  }
  out.close();
  if (!out) {
    err = "write failed: " + target.string();
    return false;
  }

  written = target;
  return true;
}

} // namespace creditrx::file_sink
