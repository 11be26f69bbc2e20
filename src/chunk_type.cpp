/**
 * @file chunk_type.cpp
 * @brief Implementation of the pngme ChunkType class.
 *
 * Refer to `chunk_type.hpp` for the property-bit table and code-level documentation.
 */
#include "pngme/chunk_type.hpp"

namespace pngme {

// Bit 5 of an ASCII letter is its case bit: 0 for 'A'..'Z', 1 for 'a'..'z'.
static constexpr uint8_t CASE_BIT = 0x20;

static inline bool is_upper(uint8_t b) { return (b & CASE_BIT) == 0; }

bool ChunkType::is_type_byte(uint8_t b) {
    return (b >= 'A' && b <= 'Z') || (b >= 'a' && b <= 'z');
}

Result<ChunkType> ChunkType::from_bytes(const std::array<uint8_t, CHUNK_TYPE_LEN>& bytes) {
    for (size_t i = 0; i < CHUNK_TYPE_LEN; ++i) {
        if (!is_type_byte(bytes[i])) {
            return Result<ChunkType>::failure(Status::InvalidTag, i);
        }
    }
    return Result<ChunkType>::success(ChunkType(bytes));
}

Result<ChunkType> ChunkType::from_string(const std::string& text) {
    if (text.size() != CHUNK_TYPE_LEN) {
        return Result<ChunkType>::failure(Status::InvalidLength, 0, CHUNK_TYPE_LEN, text.size());
    }
    std::array<uint8_t, CHUNK_TYPE_LEN> raw{};
    for (size_t i = 0; i < CHUNK_TYPE_LEN; ++i) {
        raw[i] = static_cast<uint8_t>(text[i]);
    }
    return from_bytes(raw);
}

// --- Property bits (see table in the header)

bool ChunkType::is_critical() const           { return is_upper(bytes_[0]); }
bool ChunkType::is_public() const             { return is_upper(bytes_[1]); }
bool ChunkType::is_reserved_bit_valid() const { return is_upper(bytes_[2]); }
bool ChunkType::is_safe_to_copy() const       { return !is_upper(bytes_[3]); }

bool ChunkType::is_valid() const {
    for (uint8_t b : bytes_) {
        if (!is_type_byte(b)) return false;
    }
    return is_reserved_bit_valid();
}

TypeStr ChunkType::to_string() const {
    TypeStr s;
    for (uint8_t b : bytes_) s += static_cast<char>(b);
    return s;
}

} // namespace pngme
