/**
 * @file parser.hpp
 * @brief JSON rendering (and reading) of pngme chunk types, chunks, PNGs, and errors.
 *
 * @details
 *   All JSON handling of the tool lives here so the codec itself stays free of any
 *   text format. Used by `pngme --format json` and by the chunk-inspect tool.
 *
 *   ## Chunk document
 *   @code
 *   {
 *     "type": "RuSt",
 *     "length": 42,
 *     "crc": 2882656334,
 *     "encoding": "utf8",            // or "hex" when the payload is not UTF-8
 *     "data": "This is where ...",
 *     "flags": { "critical": true, "public": false, "reserved_valid": true,
 *                "safe_to_copy": true, "valid": true }
 *   }
 *   @endcode
 *
 *   ## Error handling
 *   `from_json` catches nlohmann::json exceptions and returns std::nullopt, so it is safe
 *   on untrusted input. The `to_json` family never throws: payload text is only emitted
 *   as a JSON string after it passed the UTF-8 check.
 */

#pragma once

#include <optional>
#include <string>
#include "pngme/chunk.hpp"
#include "pngme/chunk_type.hpp"
#include "pngme/png.hpp"
#include "pngme/result.hpp"

namespace pngme {
namespace parser {

/**
 * @brief Serialize a chunk type: `{"type":..,"flags":{..}}`.
 * @param indent  nlohmann dump indent; -1 for a single line.
 */
std::string to_json(const ChunkType& type, int indent = -1);

/// Serialize one chunk (see the chunk document above).
std::string to_json(const Chunk& chunk, int indent = -1);

/// Serialize a PNG: `{"signature":"89504e470d0a1a0a","chunks":[...]}`.
std::string to_json(const Png& png, int indent = -1);

/**
 * @brief Build a chunk from `{"type":"RuSt","data":"...","encoding":"utf8"|"hex"}`.
 * @return The chunk, or std::nullopt on malformed JSON, a bad chunk type, or bad hex.
 *         `encoding` defaults to "utf8".
 */
std::optional<Chunk> from_json(const std::string& jsonStr);

/**
 * @brief Build a status event: `{"status":"error","reason":..,"offset":..,...}`.
 * @return JSON object with the fields of `describe(e)`.
 */
std::string error_json(const Error& e);

/**
 * @brief Build a generic event: `{"status":status,"detail":detail}`.
 */
std::string event_json(const std::string& status, const std::string& detail);

} // namespace parser
} // namespace pngme
