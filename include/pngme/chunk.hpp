/**
 * @page pngme-chunk pngme Chunk
 * @file chunk.hpp
 * @brief pngme Chunk: one length-prefixed, CRC-protected record of a PNG stream.
 *
 * ### Wire layout
 * | Offset  | Size | Field  | Encoding                                          |
 * |---------|------|--------|---------------------------------------------------|
 * | 0       | 4    | length | u32 big endian, payload size only                 |
 * | 4       | 4    | type   | 4 ASCII letters (see chunk_type.hpp)              |
 * | 8       | L    | data   | opaque payload                                    |
 * | 8 + L   | 4    | crc    | u32 big endian, CRC-32/ISO-HDLC of type ++ data   |
 *
 * A serialized chunk is always `12 + length()` bytes.
 *
 * ### Invariant
 * `crc()` always equals the CRC of `type ++ data`. The public constructor computes it;
 * `parse()` reads it and refuses the chunk when it does not match. There is no way to
 * hold a Chunk whose CRC disagrees with its contents.
 *
 * ### Common construction paths
 * - New chunk: `Chunk c(type, bytes);`
 * - From the wire: `auto r = Chunk::parse(buf, len); if (r) use(r.value());`
 */

#pragma once
#include "pngme/chunk_type.hpp"
#include "pngme/result.hpp"
#include <string>
#include <vector>
#include <stdint.h>
#include <stddef.h>

namespace pngme {

/// Bytes of framing around the payload: length (4) + type (4) + crc (4).
static constexpr size_t CHUNK_OVERHEAD = 12;

/// Largest payload the 32-bit length field can describe.
static constexpr uint64_t CHUNK_MAX_DATA = 0xFFFFFFFFu;

class Chunk {
public:
    /**
     * @brief Build a chunk from a type and payload; the CRC is computed here.
     * @pre `data.size() <= CHUNK_MAX_DATA`. Larger payloads cannot be framed; check with
     *      `fits_length()` first when the size comes from outside.
     */
    Chunk(const ChunkType& type, std::vector<uint8_t> data);

    /// True if a payload of `n` bytes fits the length field.
    static bool fits_length(size_t n) { return static_cast<uint64_t>(n) <= CHUNK_MAX_DATA; }

    /**
     * @brief Parse a buffer that holds exactly one serialized chunk.
     * @return The chunk, or Truncated / InvalidTag / ChecksumMismatch from the field reads,
     *         or TrailingBytes if bytes remain after the CRC.
     */
    static Result<Chunk> parse(const uint8_t* buf, size_t len);
    static Result<Chunk> parse(const std::vector<uint8_t>& buf);

    /**
     * @brief Parse the chunk at the start of `buf`; anything after it is left alone.
     *
     * Callers advance by `wire_size()` of the returned chunk. Error offsets are relative
     * to `buf`.
     */
    static Result<Chunk> parse_prefix(const uint8_t* buf, size_t len);

    /// Payload size in bytes (framing not included).
    uint32_t length() const { return static_cast<uint32_t>(data_.size()); }

    const ChunkType& chunk_type() const { return type_; }
    const std::vector<uint8_t>& data() const { return data_; }
    uint32_t crc() const { return crc_; }

    /// Size of `as_bytes()`: 12 + length().
    size_t wire_size() const { return CHUNK_OVERHEAD + data_.size(); }

    /**
     * @brief The payload as text.
     * @return The payload bytes as a std::string, or Status::NotUtf8 with `offset` at the
     *         first byte of the first malformed sequence.
     */
    Result<std::string> data_as_string() const;

    /// Serialize: length, type, data, crc.
    std::vector<uint8_t> as_bytes() const;

    /// CRC-32/ISO-HDLC over the 4 type bytes followed by `n` payload bytes.
    static uint32_t compute_crc(const ChunkType& type, const uint8_t* data, size_t n);

    bool operator==(const Chunk& other) const {
        return type_ == other.type_ && crc_ == other.crc_ && data_ == other.data_;
    }
    bool operator!=(const Chunk& other) const { return !(*this == other); }

private:
    Chunk(const ChunkType& type, std::vector<uint8_t> data, uint32_t crc);

    ChunkType            type_;
    std::vector<uint8_t> data_;
    uint32_t             crc_;
};

/**
 * @brief Check a byte range for well-formed UTF-8.
 * @param bad_at On failure, receives the offset of the first malformed sequence.
 * @return true if the whole range is valid UTF-8.
 */
bool is_utf8(const uint8_t* p, size_t n, size_t* bad_at = nullptr);

} // namespace pngme
