#include "pngme/result.hpp"

#include <sstream>

namespace pngme {

const char* status_name(Status s) {
  switch (s) {
    case Status::Ok:               return "ok";
    case Status::InvalidLength:    return "invalid_length";
    case Status::InvalidTag:       return "invalid_tag";
    case Status::Truncated:        return "truncated";
    case Status::ChecksumMismatch: return "checksum_mismatch";
    case Status::BadSignature:     return "bad_signature";
    case Status::TrailingBytes:    return "trailing_bytes";
    case Status::NotUtf8:          return "not_utf8";
    case Status::NotFound:         return "not_found";
  }
  return "unknown";
}

// "reason=truncated offset=8 expected=42 actual=17"
// expected/actual are left out when both are zero (nothing was compared).
std::string describe(const Error& e) {
  std::ostringstream os;
  os << "reason=" << status_name(e.code) << " offset=" << e.offset;
  if (e.expected != 0 || e.actual != 0) {
    os << " expected=" << e.expected << " actual=" << e.actual;
  }
  return os.str();
}

} // namespace pngme
