#include <doctest/doctest.h>
#include "commands.hpp"
#include "file_io.hpp"
#include "pngme/png.hpp"

#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h> // getpid

using namespace pngme;
namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed when the test ends.
struct TempDir {
    fs::path path;
    TempDir() {
        static int counter = 0;
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() /
               ("pngme-test-" + std::to_string(::getpid()) + "-" + std::to_string(stamp) + "-" + std::to_string(counter++));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    std::string file(const char* name) const { return (path / name).string(); }
};

static Chunk chunk_of(const char* type, const std::string& data) {
    auto t = ChunkType::from_string(type);
    REQUIRE(t.ok());
    return Chunk(t.value(), std::vector<uint8_t>(data.begin(), data.end()));
}

// Minimal PNG: IHDR + IEND.
static std::string write_sample(const TempDir& dir, const char* name) {
    Png png;
    png.append_chunk(chunk_of("IHDR", std::string(13, '\x01')));
    png.append_chunk(chunk_of("IEND", ""));
    const std::string path = dir.file(name);
    std::string err;
    REQUIRE(write_file_atomic(path, png.as_bytes(), err));
    return path;
}

static std::vector<uint8_t> slurp(const std::string& path) {
    std::vector<uint8_t> b;
    std::string err;
    REQUIRE(read_file(path, b, err));
    return b;
}

TEST_CASE("file_io writes and reads back the same bytes") {
    TempDir dir;
    const std::string p = dir.file("blob.bin");
    std::vector<uint8_t> data(200000);
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<uint8_t>(i * 31);

    std::string err;
    REQUIRE(write_file_atomic(p, data, err));
    CHECK(slurp(p) == data);
    CHECK_FALSE(fs::exists(p + ".tmp"));
}

TEST_CASE("file_io reports a missing file") {
    TempDir dir;
    std::vector<uint8_t> b;
    std::string err;
    CHECK_FALSE(read_file(dir.file("missing.png"), b, err));
    CHECK(err.rfind("open_failed", 0) == 0);
}

TEST_CASE("encode keeps the file mode of the PNG it rewrites") {
    TempDir dir;
    const std::string png = write_sample(dir, "private.png");
    fs::permissions(png, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);

    OutputOptions opt;
    std::ostringstream out, err;
    REQUIRE(encode(EncodeArgs{png, "ruSt", "secret", ""}, opt, out, err) == EXIT_OK);

    const auto perms = fs::status(png).permissions() & fs::perms::all;
    CHECK(perms == (fs::perms::owner_read | fs::perms::owner_write));
}

TEST_CASE("encode through a symlink updates the target and keeps the link") {
    TempDir dir;
    const std::string real = write_sample(dir, "real.png");
    const std::string link = dir.file("link.png");
    fs::create_symlink(real, link);

    OutputOptions opt;
    std::ostringstream out, err;
    REQUIRE(encode(EncodeArgs{link, "ruSt", "via link", ""}, opt, out, err) == EXIT_OK);

    CHECK(fs::is_symlink(fs::symlink_status(link)));
    auto parsed = Png::parse(slurp(real));
    REQUIRE(parsed.ok());
    CHECK(parsed.value().chunks().size() == 3);

    std::ostringstream rout, rerr;
    REQUIRE(remove(RemoveArgs{link, "ruSt"}, opt, rout, rerr) == EXIT_OK);
    CHECK(fs::is_symlink(fs::symlink_status(link)));
    CHECK_FALSE(fs::exists(dir.file("link.png.tmp")));
}

TEST_CASE("encode then decode returns the message") {
    TempDir dir;
    const std::string png = write_sample(dir, "a.png");
    OutputOptions opt;
    std::ostringstream out, err;

    EncodeArgs enc{png, "ruSt", "hidden message", ""};
    REQUIRE(encode(enc, opt, out, err) == EXIT_OK);
    CHECK(out.str().rfind("status=ok type=ruSt", 0) == 0);

    std::ostringstream dout, derr;
    DecodeArgs dec{png, "ruSt"};
    REQUIRE(decode(dec, opt, dout, derr) == EXIT_OK);
    CHECK(dout.str() == "hidden message\n");
    CHECK(derr.str().empty());
}

TEST_CASE("encode with an output path leaves the input untouched") {
    TempDir dir;
    const std::string in = write_sample(dir, "in.png");
    const std::string outp = dir.file("out.png");
    const auto before = slurp(in);

    OutputOptions opt;
    opt.format = Format::Raw;
    std::ostringstream out, err;
    REQUIRE(encode(EncodeArgs{in, "ruSt", "x", outp}, opt, out, err) == EXIT_OK);
    CHECK(out.str().empty());

    CHECK(slurp(in) == before);
    auto parsed = Png::parse(slurp(outp));
    REQUIRE(parsed.ok());
    CHECK(parsed.value().chunks().size() == 3);
}

TEST_CASE("encode rejects a bad chunk type before touching the file") {
    TempDir dir;
    OutputOptions opt;
    std::ostringstream out, err;
    // The file does not even exist: the type check comes first.
    CHECK(encode(EncodeArgs{dir.file("none.png"), "ru5t", "x", ""}, opt, out, err) == EXIT_BAD_TYPE);
    CHECK(err.str().find("reason=invalid_tag") != std::string::npos);

    std::ostringstream err2;
    CHECK(encode(EncodeArgs{dir.file("none.png"), "toolong", "x", ""}, opt, out, err2) == EXIT_BAD_TYPE);
    CHECK(err2.str().find("reason=invalid_length") != std::string::npos);
}

TEST_CASE("encode into a file that is not a PNG fails and leaves it alone") {
    TempDir dir;
    const std::string p = dir.file("text.png");
    const std::vector<uint8_t> junk = {'n', 'o', 't', ' ', 'a', ' ', 'p', 'n', 'g'};
    std::string e;
    REQUIRE(write_file_atomic(p, junk, e));

    OutputOptions opt;
    std::ostringstream out, err;
    CHECK(encode(EncodeArgs{p, "ruSt", "x", ""}, opt, out, err) == EXIT_BAD_PNG);
    CHECK(err.str().find("reason=bad_signature") != std::string::npos);
    CHECK(slurp(p) == junk);
}

TEST_CASE("missing input file is an I/O error") {
    TempDir dir;
    OutputOptions opt;
    std::ostringstream out, err;
    CHECK(print_chunks(PrintArgs{dir.file("nope.png")}, opt, out, err) == EXIT_IO);
    CHECK(err.str().find("reason=open_failed") != std::string::npos);
}

TEST_CASE("remove then decode is NotFound") {
    TempDir dir;
    const std::string png = write_sample(dir, "r.png");
    OutputOptions opt;
    std::ostringstream out, err;

    REQUIRE(encode(EncodeArgs{png, "ruSt", "bye", ""}, opt, out, err) == EXIT_OK);
    REQUIRE(remove(RemoveArgs{png, "ruSt"}, opt, out, err) == EXIT_OK);

    std::ostringstream dout, derr;
    CHECK(decode(DecodeArgs{png, "ruSt"}, opt, dout, derr) == EXIT_NOT_FOUND);
    CHECK(derr.str().find("reason=not_found") != std::string::npos);

    std::ostringstream rerr;
    CHECK(remove(RemoveArgs{png, "ruSt"}, opt, out, rerr) == EXIT_NOT_FOUND);

    auto parsed = Png::parse(slurp(png));
    REQUIRE(parsed.ok());
    CHECK(parsed.value().chunks().size() == 2);
}

TEST_CASE("decode of a binary chunk is NotUtf8 in pretty mode but fine raw") {
    TempDir dir;
    Png png;
    png.append_chunk(chunk_of("biNz", std::string("\xFF\xFE\x00", 3)));
    const std::string p = dir.file("bin.png");
    std::string e;
    REQUIRE(write_file_atomic(p, png.as_bytes(), e));

    OutputOptions opt;
    std::ostringstream out, err;
    CHECK(decode(DecodeArgs{p, "biNz"}, opt, out, err) == EXIT_NOT_UTF8);
    CHECK(err.str().find("reason=not_utf8") != std::string::npos);

    opt.format = Format::Raw;
    std::ostringstream rout, rerr;
    CHECK(decode(DecodeArgs{p, "biNz"}, opt, rout, rerr) == EXIT_OK);
    CHECK(rout.str() == std::string("\xFF\xFE\x00", 3));
}

TEST_CASE("print lists every chunk in each format") {
    TempDir dir;
    const std::string png = write_sample(dir, "p.png");
    OutputOptions opt;

    std::ostringstream pretty, err;
    REQUIRE(print_chunks(PrintArgs{png}, opt, pretty, err) == EXIT_OK);
    CHECK(pretty.str().find("Type: IHDR (critical, public, reserved-valid, unsafe-to-copy)") != std::string::npos);
    CHECK(pretty.str().find("Type: IEND") != std::string::npos);

    opt.format = Format::Raw;
    std::ostringstream raw;
    REQUIRE(print_chunks(PrintArgs{png}, opt, raw, err) == EXIT_OK);
    CHECK(raw.str().find("IEND 0 2923585666\n") != std::string::npos);

    opt.format = Format::Json;
    std::ostringstream js;
    REQUIRE(print_chunks(PrintArgs{png}, opt, js, err) == EXIT_OK);
    CHECK(js.str().find("\"signature\": \"89504e470d0a1a0a\"") != std::string::npos);
}

TEST_CASE("json errors go to the error stream as documents") {
    TempDir dir;
    const std::string png = write_sample(dir, "j.png");
    OutputOptions opt;
    opt.format = Format::Json;
    std::ostringstream out, err;
    CHECK(decode(DecodeArgs{png, "NoNe"}, opt, out, err) == EXIT_NOT_FOUND);
    CHECK(err.str().find("\"reason\":\"not_found\"") != std::string::npos);
}

TEST_CASE("describe_chunk and describe_chunk_type layouts") {
    Chunk c = chunk_of("RuSt", "This is where your secret message will be!");
    CHECK(describe_chunk(c) ==
          "Chunk {\n"
          "  Length: 42\n"
          "  Type: RuSt (critical, private, reserved-valid, safe-to-copy)\n"
          "  Data: 42 bytes\n"
          "  Crc: 2882656334\n"
          "}");

    auto t = ChunkType::from_string("Rust");
    REQUIRE(t.ok());
    const std::string d = describe_chunk_type(t.value());
    CHECK(d.find("Valid: false") != std::string::npos);
    CHECK(d.find("Reserved valid: false") != std::string::npos);
}

TEST_CASE("exit code mapping") {
    CHECK(exit_code_for_lookup(Status::InvalidLength) == EXIT_BAD_TYPE);
    CHECK(exit_code_for_lookup(Status::InvalidTag) == EXIT_BAD_TYPE);
    CHECK(exit_code_for_lookup(Status::NotFound) == EXIT_NOT_FOUND);
    CHECK(exit_code_for_lookup(Status::NotUtf8) == EXIT_NOT_UTF8);
    CHECK(exit_code_for_file(Status::InvalidTag) == EXIT_BAD_PNG);
    CHECK(exit_code_for_file(Status::TrailingBytes) == EXIT_BAD_PNG);
    CHECK(exit_code_for_file(Status::Ok) == EXIT_OK);
}
