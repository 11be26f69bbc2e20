/**
 * @file png.cpp
 * @brief Implementation of pngme::Png: whole-buffer parse, serialize, and chunk edits.
 */
#include "pngme/png.hpp"

#include <algorithm>
#include <utility>

namespace pngme {

Png::Png(std::vector<Chunk> chunks) : chunks_(std::move(chunks)) {}

// ---------------------------------------------------------------------------
// parse()
// -------
// 1) Signature must match byte for byte. A differing byte reports the byte
//    pair; a buffer that ends inside the signature reports the size pair.
// 2) Chunks are taken back to back until the buffer is used up exactly.
//    Any chunk failure aborts the whole parse; no partial Png is returned.
// ---------------------------------------------------------------------------
Result<Png> Png::parse(const uint8_t* buf, size_t len) {
    for (size_t i = 0; i < PNG_SIGNATURE_LEN; ++i) {
        if (i >= len) {
            return Result<Png>::failure(Status::BadSignature, i, PNG_SIGNATURE_LEN, len);
        }
        if (buf[i] != STANDARD_HEADER[i]) {
            return Result<Png>::failure(Status::BadSignature, i, STANDARD_HEADER[i], buf[i]);
        }
    }

    std::vector<Chunk> chunks;
    size_t pos = PNG_SIGNATURE_LEN;
    while (pos < len) {
        const size_t left = len - pos;
        if (left < CHUNK_OVERHEAD) {
            // Not even room for an empty chunk.
            return Result<Png>::failure(Status::TrailingBytes, pos, CHUNK_OVERHEAD, left);
        }
        auto chunk = Chunk::parse_prefix(buf + pos, left);
        if (!chunk) return Result<Png>::failure(chunk.error().shifted(pos));
        pos += chunk.value().wire_size();
        chunks.push_back(chunk.take());
    }

    return Result<Png>::success(Png(std::move(chunks)));
}

Result<Png> Png::parse(const std::vector<uint8_t>& buf) {
    return parse(buf.data(), buf.size());
}

// ---------------------------------------------------------------------------
// Edits
// ---------------------------------------------------------------------------

void Png::append_chunk(Chunk chunk) {
    chunks_.push_back(std::move(chunk));
}

Result<const Chunk*> Png::chunk_by_type(const std::string& type) const {
    auto wanted = ChunkType::from_string(type);
    if (!wanted) return Result<const Chunk*>::failure(wanted.error());

    for (const auto& c : chunks_) {
        if (c.chunk_type() == wanted.value()) return Result<const Chunk*>::success(&c);
    }
    return Result<const Chunk*>::success(nullptr);
}

Result<Chunk> Png::remove_chunk(const std::string& type) {
    auto wanted = ChunkType::from_string(type);
    if (!wanted) return Result<Chunk>::failure(wanted.error());

    auto it = std::find_if(chunks_.begin(), chunks_.end(),
                           [&](const Chunk& c) { return c.chunk_type() == wanted.value(); });
    if (it == chunks_.end()) return Result<Chunk>::failure(Status::NotFound);

    Chunk removed = std::move(*it);
    chunks_.erase(it);
    return Result<Chunk>::success(std::move(removed));
}

std::vector<uint8_t> Png::as_bytes() const {
    size_t total = PNG_SIGNATURE_LEN;
    for (const auto& c : chunks_) total += c.wire_size();

    std::vector<uint8_t> out;
    out.reserve(total);
    out.insert(out.end(), STANDARD_HEADER.begin(), STANDARD_HEADER.end());
    for (const auto& c : chunks_) {
        const auto b = c.as_bytes();
        out.insert(out.end(), b.begin(), b.end());
    }
    return out;
}

} // namespace pngme
