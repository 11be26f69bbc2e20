/**
 * @file parser.cpp
 * @brief JSON serialization layer for pngme chunks and PNGs (nlohmann::json).
 *
 * @details
 *   Payloads are written as JSON text only when they are valid UTF-8; anything else goes
 *   out as lowercase hex with `"encoding":"hex"`. nlohmann::json refuses to dump invalid
 *   UTF-8, so this check is what keeps `to_json` from throwing.
 */

#include "pngme/parser.hpp"

#include <nlohmann/json.hpp>
using nlohmann::json;

namespace pngme {
namespace parser {

// ---------------------------------------------------------------------------
// Hex helpers
// ---------------------------------------------------------------------------

static std::string to_hex(const uint8_t* p, size_t n) {
    static const char* DIGITS = "0123456789abcdef";
    std::string s;
    s.reserve(n * 2);
    for (size_t i = 0; i < n; ++i) {
        s += DIGITS[p[i] >> 4];
        s += DIGITS[p[i] & 0x0F];
    }
    return s;
}

static bool hex_val(char c, uint8_t& out) {
    if (c >= '0' && c <= '9') { out = static_cast<uint8_t>(c - '0'); return true; }
    if (c >= 'a' && c <= 'f') { out = static_cast<uint8_t>(c - 'a' + 10); return true; }
    if (c >= 'A' && c <= 'F') { out = static_cast<uint8_t>(c - 'A' + 10); return true; }
    return false;
}

static bool from_hex(const std::string& s, std::vector<uint8_t>& out) {
    if (s.size() % 2 != 0) return false;
    out.clear();
    out.reserve(s.size() / 2);
    for (size_t i = 0; i < s.size(); i += 2) {
        uint8_t hi = 0, lo = 0;
        if (!hex_val(s[i], hi) || !hex_val(s[i + 1], lo)) return false;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return true;
}

// ---------------------------------------------------------------------------
// Document builders
// ---------------------------------------------------------------------------

static json flags_doc(const ChunkType& t) {
    json f;
    f["critical"]       = t.is_critical();
    f["public"]         = t.is_public();
    f["reserved_valid"] = t.is_reserved_bit_valid();
    f["safe_to_copy"]   = t.is_safe_to_copy();
    f["valid"]          = t.is_valid();
    return f;
}

static json chunk_doc(const Chunk& c) {
    json j;
    j["type"]   = std::string(c.chunk_type().to_string().c_str());
    j["length"] = c.length();
    j["crc"]    = c.crc();

    auto text = c.data_as_string();
    if (text) {
        j["encoding"] = "utf8";
        j["data"]     = text.value();
    } else {
        j["encoding"] = "hex";
        j["data"]     = to_hex(c.data().data(), c.data().size());
    }
    j["flags"] = flags_doc(c.chunk_type());
    return j;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

std::string to_json(const ChunkType& type, int indent) {
    json j;
    j["type"]  = std::string(type.to_string().c_str());
    j["flags"] = flags_doc(type);
    return j.dump(indent);
}

std::string to_json(const Chunk& chunk, int indent) {
    return chunk_doc(chunk).dump(indent);
}

std::string to_json(const Png& png, int indent) {
    json j;
    j["signature"] = to_hex(png.header().data(), png.header().size());
    json arr = json::array();
    for (const auto& c : png.chunks()) arr.push_back(chunk_doc(c));
    j["chunks"] = arr;
    return j.dump(indent);
}

std::optional<Chunk> from_json(const std::string& jsonStr) {
    try {
        auto j = json::parse(jsonStr);
        if (!j.is_object() || !j.contains("type") || !j.contains("data")) {
            return std::nullopt;
        }

        auto type = ChunkType::from_string(j.at("type").get<std::string>());
        if (!type) return std::nullopt;

        const std::string encoding = j.value("encoding", std::string("utf8"));
        const std::string data = j.at("data").get<std::string>();

        std::vector<uint8_t> bytes;
        if (encoding == "hex") {
            if (!from_hex(data, bytes)) return std::nullopt;
        } else if (encoding == "utf8") {
            bytes.assign(data.begin(), data.end());
        } else {
            return std::nullopt;
        }
        return Chunk(type.value(), std::move(bytes));
    }
    catch (const json::exception&) {
        // Malformed JSON or a field of the wrong type.
        return std::nullopt;
    }
}

std::string error_json(const Error& e) {
    json j;
    j["status"] = "error";
    j["reason"] = status_name(e.code);
    j["offset"] = e.offset;
    if (e.expected != 0 || e.actual != 0) {
        j["expected"] = e.expected;
        j["actual"]   = e.actual;
    }
    return j.dump();
}

std::string event_json(const std::string& status, const std::string& detail) {
    json j;
    j["status"] = status;
    j["detail"] = detail;
    return j.dump();
}

} // namespace parser
} // namespace pngme
