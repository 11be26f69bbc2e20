/**
 * @file chunk.cpp
 * @brief Implementation of pngme::Chunk: framing, CRC, and payload text access.
 *
 * Refer to `chunk.hpp` for the wire layout.
 */
#include "pngme/chunk.hpp"

#include "etl/crc32.h"    // etl::crc32: CRC-32/ISO-HDLC (poly 0x04C11DB7, reflected, init/xorout 0xFFFFFFFF)
#include <utility>

namespace pngme {

// ============================================================================
// Byte order helpers. Every integer in a PNG stream is big endian.
// ============================================================================

static inline uint32_t read_be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8)  |
            static_cast<uint32_t>(p[3]);
}

static inline void push_be32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

// ============================================================================
// Construction
// ============================================================================

Chunk::Chunk(const ChunkType& type, std::vector<uint8_t> data)
    : type_(type), data_(std::move(data)), crc_(0) {
    crc_ = compute_crc(type_, data_.data(), data_.size());
}

Chunk::Chunk(const ChunkType& type, std::vector<uint8_t> data, uint32_t crc)
    : type_(type), data_(std::move(data)), crc_(crc) {}

uint32_t Chunk::compute_crc(const ChunkType& type, const uint8_t* data, size_t n) {
    const auto tb = type.bytes();
    etl::crc32 crc;
    crc.add(tb.begin(), tb.end());
    if (n) crc.add(data, data + n);
    return crc.value();
}

// ============================================================================
// Parsing
// ---------------------------------------------------------------------------
// Fields are read strictly in wire order. Each read first checks that the
// field fits in what is left of the buffer, so the first field that does not
// fit is the one reported as Truncated.
// ============================================================================

Result<Chunk> Chunk::parse_prefix(const uint8_t* buf, size_t len) {
    size_t pos = 0;

    // length
    if (len - pos < 4) return Result<Chunk>::failure(Status::Truncated, pos, 4, len - pos);
    const uint32_t length = read_be32(buf + pos);
    pos += 4;

    // type
    if (len - pos < 4) return Result<Chunk>::failure(Status::Truncated, pos, 4, len - pos);
    std::array<uint8_t, CHUNK_TYPE_LEN> raw{};
    for (size_t i = 0; i < CHUNK_TYPE_LEN; ++i) raw[i] = buf[pos + i];
    auto type = ChunkType::from_bytes(raw);
    if (!type) return Result<Chunk>::failure(type.error().shifted(pos));
    pos += 4;

    // data
    if (len - pos < length) return Result<Chunk>::failure(Status::Truncated, pos, length, len - pos);
    const uint8_t* data = buf + pos;
    pos += length;

    // crc
    if (len - pos < 4) return Result<Chunk>::failure(Status::Truncated, pos, 4, len - pos);
    const uint32_t stored = read_be32(buf + pos);
    const uint32_t computed = compute_crc(type.value(), data, length);
    if (stored != computed) {
        return Result<Chunk>::failure(Status::ChecksumMismatch, pos, computed, stored);
    }

    return Result<Chunk>::success(Chunk(type.value(), std::vector<uint8_t>(data, data + length), stored));
}

Result<Chunk> Chunk::parse(const uint8_t* buf, size_t len) {
    auto r = parse_prefix(buf, len);
    if (r && r.value().wire_size() != len) {
        const size_t used = r.value().wire_size();
        return Result<Chunk>::failure(Status::TrailingBytes, used, used, len);
    }
    return r;
}

Result<Chunk> Chunk::parse(const std::vector<uint8_t>& buf) {
    return parse(buf.data(), buf.size());
}

// ============================================================================
// Accessors / serialization
// ============================================================================

Result<std::string> Chunk::data_as_string() const {
    size_t bad = 0;
    if (!is_utf8(data_.data(), data_.size(), &bad)) {
        return Result<std::string>::failure(Status::NotUtf8, bad);
    }
    return Result<std::string>::success(std::string(data_.begin(), data_.end()));
}

std::vector<uint8_t> Chunk::as_bytes() const {
    std::vector<uint8_t> out;
    out.reserve(wire_size());
    push_be32(out, length());
    const auto tb = type_.bytes();
    out.insert(out.end(), tb.begin(), tb.end());
    out.insert(out.end(), data_.begin(), data_.end());
    push_be32(out, crc_);
    return out;
}

// ---------------------------------------------------------------------------
// is_utf8()
// ---------
// Accepts exactly the well-formed sequences of RFC 3629:
//   00..7F
//   C2..DF 80..BF
//   E0 A0..BF 80..BF | E1..EC 80..BF 80..BF | ED 80..9F 80..BF | EE..EF 80..BF 80..BF
//   F0 90..BF 80..BF 80..BF | F1..F3 80..BF x3 | F4 80..8F 80..BF 80..BF
// Overlong forms, surrogates (U+D800..DFFF) and values above U+10FFFF fail.
// ---------------------------------------------------------------------------
bool is_utf8(const uint8_t* p, size_t n, size_t* bad_at) {
    auto cont = [](uint8_t b) { return (b & 0xC0) == 0x80; };

    size_t i = 0;
    while (i < n) {
        const uint8_t b0 = p[i];
        size_t need = 0;
        uint8_t lo = 0x80, hi = 0xBF;   // allowed range of the second byte

        if (b0 < 0x80)                     { ++i; continue; }
        else if (b0 >= 0xC2 && b0 <= 0xDF) { need = 1; }
        else if (b0 == 0xE0)               { need = 2; lo = 0xA0; }
        else if (b0 >= 0xE1 && b0 <= 0xEC) { need = 2; }
        else if (b0 == 0xED)               { need = 2; hi = 0x9F; }
        else if (b0 >= 0xEE && b0 <= 0xEF) { need = 2; }
        else if (b0 == 0xF0)               { need = 3; lo = 0x90; }
        else if (b0 >= 0xF1 && b0 <= 0xF3) { need = 3; }
        else if (b0 == 0xF4)               { need = 3; hi = 0x8F; }
        else {
            if (bad_at) *bad_at = i;
            return false;
        }

        if (n - i - 1 < need || p[i + 1] < lo || p[i + 1] > hi) {
            if (bad_at) *bad_at = i;
            return false;
        }
        for (size_t k = 2; k <= need; ++k) {
            if (!cont(p[i + k])) {
                if (bad_at) *bad_at = i;
                return false;
            }
        }
        i += need + 1;
    }
    return true;
}

} // namespace pngme
