/**
 * @page pngme-file-io pngme File I/O API (Header)
 * @file file_io.hpp
 * @brief Whole-file read and atomic whole-file write for the pngme command line tool.
 *
 * @details
 * PURPOSE
 * -------
 * The codec in include/pngme/ never touches the filesystem. It takes a complete byte
 * buffer and hands a complete byte buffer back. This header is the thin layer that
 * moves those buffers between disk and memory for the CLI.
 *
 * DESIGN CHOICES
 * --------------
 * - Free functions, POSIX descriptors, no classes.
 * - Whole-file only. PNGs are read in one go; there is no streaming path.
 * - Writes go to `<path>.tmp` first and are renamed over the target, so a failed
 *   write never leaves a half-written PNG behind. A symlinked `<path>` is followed
 *   (the link survives) and the replaced file keeps its permission bits.
 * - Failures return false and fill `err` with a short `key=value` fragment such as
 *   `open_failed errno=2`, ready to be appended to a `status=error reason=` line.
 *
 * EXAMPLE
 * -------
 * @code
 *   std::vector<uint8_t> bytes;
 *   std::string err;
 *   if (!pngme::read_file("in.png", bytes, err)) {
 *       std::cerr << "status=error reason=" << err << "\n";
 *   }
 * @endcode
 */

#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace pngme {

/**
 * @brief Read an entire file into memory.
 * @param path File to read.
 * @param out  Receives the file contents (cleared first).
 * @param err  On failure: `open_failed`, `read_failed` (with errno).
 * @return true on success.
 */
bool read_file(const std::string& path, std::vector<uint8_t>& out, std::string& err);

/**
 * @brief Replace a file's contents atomically.
 * @param path  Destination file; created (mode 0644 before umask) if missing. Symlinks are
 *              followed and an existing file keeps its mode.
 * @param bytes New contents.
 * @param err   On failure: `resolve_failed`, `open_failed`, `chmod_failed`, `write_failed`,
 *              `sync_failed`, `rename_failed`.
 * @return true if `path` now holds exactly `bytes`.
 */
bool write_file_atomic(const std::string& path, const std::vector<uint8_t>& bytes, std::string& err);

} // namespace pngme
