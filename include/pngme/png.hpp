/**
 * @page pngme-png pngme Png
 * @file png.hpp
 * @brief pngme Png: the signature-prefixed, ordered chunk sequence of a PNG file.
 *
 * ### Layout
 * | Offset | Size       | Content                                        |
 * |--------|------------|------------------------------------------------|
 * | 0      | 8          | signature 89 50 4E 47 0D 0A 1A 0A              |
 * | 8      | 12 + L0    | chunk 0                                        |
 * | ...    | 12 + Ln    | chunk n                                        |
 *
 * The buffer must end exactly after the last chunk. `IEND` is just another chunk here:
 * nothing stops parsing at it, and chunks appended after it stay after it.
 *
 * ### Lookup rules
 * - Several chunks may share a type. Lookups and removals always pick the first one
 *   in file order.
 * - Type text is validated before searching, so a bad type fails with
 *   InvalidLength / InvalidTag even on an empty Png.
 *
 * ### Typical flow
 * @code
 *   auto parsed = pngme::Png::parse(file_bytes);
 *   if (!parsed) return fail(parsed.error());
 *   pngme::Png png = parsed.take();
 *   png.append_chunk(pngme::Chunk(type, message_bytes));
 *   write(png.as_bytes());
 * @endcode
 */

#pragma once
#include "pngme/chunk.hpp"
#include "pngme/result.hpp"
#include <array>
#include <string>
#include <vector>
#include <stdint.h>
#include <stddef.h>

namespace pngme {

/// Size of the PNG signature.
static constexpr size_t PNG_SIGNATURE_LEN = 8;

class Png {
public:
    /// The PNG file signature: \x89 P N G \r \n \x1A \n
    static constexpr std::array<uint8_t, PNG_SIGNATURE_LEN> STANDARD_HEADER = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
    };

    /// Empty PNG: signature only, no chunks.
    Png() = default;

    /// PNG holding `chunks` in the given order.
    explicit Png(std::vector<Chunk> chunks);

    /**
     * @brief Parse a complete PNG byte stream.
     * @return The Png, or:
     *   - BadSignature if the buffer starts with anything else (`offset` = first differing
     *     byte, `expected`/`actual` = signature byte and file byte) or ends inside the
     *     signature (`expected` = 8, `actual` = buffer size);
     *   - TrailingBytes if fewer than 12 bytes are left after the last whole chunk;
     *   - the failure of the first chunk that does not parse (Truncated, InvalidTag,
     *     ChecksumMismatch), with `offset` absolute in `buf`.
     */
    static Result<Png> parse(const uint8_t* buf, size_t len);
    static Result<Png> parse(const std::vector<uint8_t>& buf);

    /// Add a chunk at the end. No uniqueness check.
    void append_chunk(Chunk chunk);

    /**
     * @brief Find the first chunk of a type.
     * @param type Type text, e.g. "tEXt".
     * @return Pointer to the chunk (valid until the next mutation), nullptr if there is
     *         none, or InvalidLength / InvalidTag if `type` is not a chunk type.
     */
    Result<const Chunk*> chunk_by_type(const std::string& type) const;

    /**
     * @brief Remove and return the first chunk of a type.
     * @return The removed chunk, NotFound (nothing removed), or InvalidLength / InvalidTag.
     */
    Result<Chunk> remove_chunk(const std::string& type);

    const std::array<uint8_t, PNG_SIGNATURE_LEN>& header() const { return STANDARD_HEADER; }
    const std::vector<Chunk>& chunks() const { return chunks_; }

    /// Signature followed by every chunk's bytes, in order.
    std::vector<uint8_t> as_bytes() const;

private:
    std::vector<Chunk> chunks_;
};

} // namespace pngme
