/**
 * @page pngme-chunk-type pngme ChunkType
 * @file chunk_type.hpp
 * @brief pngme ChunkType: the 4-byte chunk type code with its case-encoded property bits.
 *
 * Every PNG chunk carries a 4-byte type code such as `IHDR`, `tEXt` or `RuSt`. Each byte
 * must be an ASCII letter, and the *case* of each letter (bit 5 of the byte) is a flag:
 *
 * | Byte | Property        | Uppercase (bit 5 = 0) | Lowercase (bit 5 = 1) |
 * |------|-----------------|-----------------------|-----------------------|
 * | 0    | Ancillary bit   | critical              | ancillary             |
 * | 1    | Private bit     | public                | private               |
 * | 2    | Reserved bit    | valid (must be upper) | invalid               |
 * | 3    | Safe-to-copy    | unsafe to copy        | safe to copy          |
 *
 * ### Example
 * `RuSt` decodes as:
 * - `R` → critical
 * - `u` → private (not public)
 * - `S` → reserved bit valid
 * - `t` → safe to copy
 *
 * `Rust` is a well-formed type (all letters) but is not *valid*: its reserved byte is lowercase.
 *
 * @note Construction only checks that bytes are letters. Validity (the reserved bit) is a
 *       separate question answered by `is_valid()`.
 */

#ifndef PNGME_CHUNK_TYPE_HPP
#define PNGME_CHUNK_TYPE_HPP

#include "pngme/result.hpp"
#include "etl/string.h"
#include <array>
#include <string>
#include <stdint.h>
#include <stddef.h>

namespace pngme {

/// Number of bytes in a chunk type code.
static constexpr size_t CHUNK_TYPE_LEN = 4;

/// Printable form of a chunk type ("RuSt").
using TypeStr = etl::string<CHUNK_TYPE_LEN>;

/**
 * @class ChunkType
 * @brief Immutable 4-letter chunk type code.
 *
 * Only the two factories create a ChunkType, so every instance holds four ASCII letters.
 * The property getters are pure bit tests on the stored bytes; nothing is cached.
 */
class ChunkType {
public:
    /**
     * @brief Build from four raw bytes.
     * @param bytes The type code exactly as it appears on the wire.
     * @return The ChunkType, or Status::InvalidTag with `offset` = index of the first
     *         byte that is not an ASCII letter.
     */
    static Result<ChunkType> from_bytes(const std::array<uint8_t, CHUNK_TYPE_LEN>& bytes);

    /**
     * @brief Build from text such as "RuSt".
     * @param text Must be exactly 4 bytes long.
     * @return The ChunkType, Status::InvalidLength (expected = 4, actual = text size),
     *         or Status::InvalidTag from from_bytes().
     */
    static Result<ChunkType> from_string(const std::string& text);

    /// The 4 raw bytes.
    std::array<uint8_t, CHUNK_TYPE_LEN> bytes() const { return bytes_; }

    /**
     * @brief Critical chunks must be understood by a decoder (byte 0 uppercase).
     * @return true if critical; false if ancillary.
     */
    bool is_critical() const;

    /**
     * @brief Public chunks are registered types (byte 1 uppercase).
     * @return true if public; false if private.
     */
    bool is_public() const;

    /**
     * @brief The reserved bit must be 0 in the current PNG version (byte 2 uppercase).
     * @return true if the reserved bit is valid.
     */
    bool is_reserved_bit_valid() const;

    /**
     * @brief Editors may copy unknown safe-to-copy chunks (byte 3 lowercase).
     * @return true if safe to copy.
     */
    bool is_safe_to_copy() const;

    /**
     * @brief All bytes are ASCII letters and the reserved bit is valid.
     *
     * The letter check repeats what the factories already enforce.
     */
    bool is_valid() const;

    /// The type code as text.
    TypeStr to_string() const;

    bool operator==(const ChunkType& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const ChunkType& other) const { return !(*this == other); }

    /// True for A-Z and a-z only.
    static bool is_type_byte(uint8_t b);

private:
    explicit ChunkType(const std::array<uint8_t, CHUNK_TYPE_LEN>& bytes) : bytes_(bytes) {}

    std::array<uint8_t, CHUNK_TYPE_LEN> bytes_;
};

} // namespace pngme

#endif // PNGME_CHUNK_TYPE_HPP
