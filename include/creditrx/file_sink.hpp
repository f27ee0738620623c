/**
 * @file file_sink.hpp
 * @brief Persist an assembled transfer under a name that never overwrites.
 *
 * Names come from the peripheral and are not trusted: only the final path
 * component is used, and an empty or dot-only name becomes `download.bin`.
 * If `<dir>/<name>` exists, `<stem>_1<ext>`, `<stem>_2<ext>`, ... are tried.
 */
#ifndef CREDITRX_FILE_SINK_HPP
#define CREDITRX_FILE_SINK_HPP

#include <filesystem>
#include <stdint.h>
#include <string>
#include <system_error>
#include <vector>

namespace creditrx::file_sink {

/// Name used when the peripheral supplied nothing usable.
constexpr const char* FALLBACK_NAME = "download.bin";

/// Final path component of @p name, or FALLBACK_NAME.
std::string sanitize_name(const std::string& name);

/**
 * @brief First path under @p dir for @p name that does not exist yet.
 * @return Empty path with @p ec set when a candidate cannot be checked
 *         (permission denied, symlink loop, ...).
 */
std::filesystem::path unique_path(const std::filesystem::path& dir, const std::string& name,
                                  std::error_code& ec);

/**
 * @brief Write @p data to a fresh file in @p dir (created if missing).
 * @param written Receives the path actually used.
 * @param err     Receives a message on failure.
 * @return false on any filesystem or I/O error.
 */
bool save(const std::filesystem::path& dir, const std::string& name,
          const std::vector<uint8_t>& data,
          std::filesystem::path& written, std::string& err);

} // namespace creditrx::file_sink

#endif // CREDITRX_FILE_SINK_HPP
