#include <doctest/doctest.h>
#include "pngme/parser.hpp"

#include <nlohmann/json.hpp>

using namespace pngme;
using nlohmann::json;

static Chunk chunk_of(const char* type, const std::vector<uint8_t>& data) {
    auto t = ChunkType::from_string(type);
    REQUIRE(t.ok());
    return Chunk(t.value(), data);
}

TEST_CASE("Text chunk serializes with utf8 encoding and flags") {
    const std::string msg = "This is where your secret message will be!";
    Chunk c = chunk_of("RuSt", std::vector<uint8_t>(msg.begin(), msg.end()));

    json j = json::parse(parser::to_json(c));
    CHECK(j["type"] == "RuSt");
    CHECK(j["length"] == 42);
    CHECK(j["crc"] == 2882656334u);
    CHECK(j["encoding"] == "utf8");
    CHECK(j["data"] == msg);
    CHECK(j["flags"]["critical"] == true);
    CHECK(j["flags"]["public"] == false);
    CHECK(j["flags"]["safe_to_copy"] == true);
    CHECK(j["flags"]["valid"] == true);
}

TEST_CASE("Binary chunk serializes as hex") {
    Chunk c = chunk_of("IDAT", {0x00, 0xFF, 0x10});
    json j = json::parse(parser::to_json(c));
    CHECK(j["encoding"] == "hex");
    CHECK(j["data"] == "00ff10");
}

TEST_CASE("Png serializes signature and chunks in order") {
    Png png;
    png.append_chunk(chunk_of("FrSt", {'a'}));
    png.append_chunk(chunk_of("LASt", {'b'}));

    json j = json::parse(parser::to_json(png, 2));
    CHECK(j["signature"] == "89504e470d0a1a0a");
    REQUIRE(j["chunks"].size() == 2);
    CHECK(j["chunks"][0]["type"] == "FrSt");
    CHECK(j["chunks"][1]["type"] == "LASt");
}

TEST_CASE("Chunk type serializes its flags") {
    auto t = ChunkType::from_string("Rust");
    REQUIRE(t.ok());
    json j = json::parse(parser::to_json(t.value()));
    CHECK(j["type"] == "Rust");
    CHECK(j["flags"]["reserved_valid"] == false);
    CHECK(j["flags"]["valid"] == false);
}

TEST_CASE("from_json builds a chunk from text or hex") {
    auto a = parser::from_json(R"({"type":"RuSt","data":"hi"})");
    REQUIRE(a.has_value());
    CHECK(a->length() == 2);
    CHECK(a->data() == std::vector<uint8_t>{'h', 'i'});

    auto b = parser::from_json(R"({"type":"IDAT","data":"00ff10","encoding":"hex"})");
    REQUIRE(b.has_value());
    CHECK(b->data() == std::vector<uint8_t>{0x00, 0xFF, 0x10});

    // Round trip through to_json keeps the chunk.
    auto c = parser::from_json(parser::to_json(*b));
    REQUIRE(c.has_value());
    CHECK(*c == *b);
}

TEST_CASE("from_json rejects malformed input") {
    CHECK_FALSE(parser::from_json("not json").has_value());
    CHECK_FALSE(parser::from_json(R"({"type":"RuSt"})").has_value());
    CHECK_FALSE(parser::from_json(R"({"type":"Ru1t","data":"x"})").has_value());
    CHECK_FALSE(parser::from_json(R"({"type":"RuSt","data":42})").has_value());
    CHECK_FALSE(parser::from_json(R"({"type":"RuSt","data":"abc","encoding":"hex"})").has_value());
    CHECK_FALSE(parser::from_json(R"({"type":"RuSt","data":"zz","encoding":"hex"})").has_value());
    CHECK_FALSE(parser::from_json(R"({"type":"RuSt","data":"x","encoding":"rot13"})").has_value());
}

TEST_CASE("error_json carries reason and context") {
    Error e;
    e.code = Status::ChecksumMismatch;
    e.offset = 50;
    e.expected = 7;
    e.actual = 9;
    json j = json::parse(parser::error_json(e));
    CHECK(j["status"] == "error");
    CHECK(j["reason"] == "checksum_mismatch");
    CHECK(j["offset"] == 50);
    CHECK(j["expected"] == 7);
    CHECK(j["actual"] == 9);

    Error nf;
    nf.code = Status::NotFound;
    json k = json::parse(parser::error_json(nf));
    CHECK(k["reason"] == "not_found");
    CHECK_FALSE(k.contains("expected"));
}

TEST_CASE("describe renders key=value context") {
    Error e;
    e.code = Status::Truncated;
    e.offset = 8;
    e.expected = 42;
    e.actual = 12;
    CHECK(describe(e) == "reason=truncated offset=8 expected=42 actual=12");

    Error b;
    b.code = Status::BadSignature;
    CHECK(describe(b) == "reason=bad_signature offset=0");
}
