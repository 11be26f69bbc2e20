/**
 * @file result.hpp
 * @brief pngme status codes, error context, and the Result<T> carrier used by every fallible call.
 *
 * Every operation in the core that can fail on malformed input returns a `Result<T>`:
 * either a value, or an `Error` naming what went wrong and where.
 *
 * ### Status codes
 * | Status           | Raised by                          | Meaning                                   |
 * |------------------|------------------------------------|-------------------------------------------|
 * | InvalidLength    | ChunkType::from_string             | chunk type text is not exactly 4 bytes    |
 * | InvalidTag       | ChunkType::from_bytes, Chunk::parse| a type byte is not ASCII A-Z / a-z        |
 * | Truncated        | Chunk::parse                       | a field needs more bytes than remain      |
 * | ChecksumMismatch | Chunk::parse                       | stored CRC != CRC of type ++ data         |
 * | BadSignature     | Png::parse                         | first 8 bytes are not the PNG signature   |
 * | TrailingBytes    | Chunk::parse, Png::parse           | leftovers after the last whole chunk      |
 * | NotUtf8          | Chunk::data_as_string              | payload is not well-formed UTF-8          |
 * | NotFound         | Png::remove_chunk                  | no chunk of the requested type            |
 *
 * ### Error context
 * `offset` is a byte offset into the buffer handed to the failing call (for Png::parse it is
 * absolute from the start of the file). `expected` / `actual` carry the two sides of the
 * comparison that failed: byte counts for Truncated, CRC values for ChecksumMismatch,
 * sizes for InvalidLength. Unused fields stay zero.
 *
 * ### Usage
 * @code
 *   auto png = pngme::Png::parse(bytes);
 *   if (!png) {
 *       std::cerr << "status=error " << pngme::describe(png.error()) << "\n";
 *       return 3;
 *   }
 *   for (const auto& c : png.value().chunks()) { ... }
 * @endcode
 */

#pragma once
#include <optional>
#include <string>
#include <utility>
#include <stdint.h>
#include <stddef.h>

namespace pngme {

/// Outcome of a codec call.
enum class Status : uint8_t {
  Ok = 0,
  InvalidLength,
  InvalidTag,
  Truncated,
  ChecksumMismatch,
  BadSignature,
  TrailingBytes,
  NotUtf8,
  NotFound,
};

/// Failure details. `code` is never Status::Ok inside a failed Result.
struct Error {
  Status   code     = Status::Ok;
  size_t   offset   = 0;
  uint64_t expected = 0;
  uint64_t actual   = 0;

  /// Copy of this error with `offset` moved by `base` (used when a sub-buffer failed).
  Error shifted(size_t base) const {
    Error e = *this;
    e.offset += base;
    return e;
  }
};

/// Stable snake_case name, e.g. "checksum_mismatch". Used as `reason=` in CLI output.
const char* status_name(Status s);

/// One-line `reason=... offset=... expected=... actual=...` rendering of an error.
std::string describe(const Error& e);

/**
 * @brief Either a T or an Error.
 *
 * Built through the `success()` / `failure()` factories. Reading `value()` of a failed
 * result is a programming error; check `ok()` (or the bool conversion) first.
 */
template <typename T>
class Result {
public:
  static Result success(T v) {
    Result r;
    r.value_ = std::move(v);
    return r;
  }

  static Result failure(const Error& e) {
    Result r;
    r.error_ = e;
    return r;
  }

  static Result failure(Status code, size_t offset = 0, uint64_t expected = 0, uint64_t actual = 0) {
    Error e;
    e.code = code;
    e.offset = offset;
    e.expected = expected;
    e.actual = actual;
    return failure(e);
  }

  bool ok() const { return value_.has_value(); }
  explicit operator bool() const { return ok(); }

  const T& value() const { return *value_; }
  T&       value()       { return *value_; }

  /// Move the value out; the result is left holding a moved-from T.
  T take() { return std::move(*value_); }

  const Error& error() const { return error_; }
  Status status() const { return ok() ? Status::Ok : error_.code; }

private:
  Result() = default;

  std::optional<T> value_;
  Error error_{};
};

} // namespace pngme
