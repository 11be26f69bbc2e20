#include "commands.hpp"      // Our own header: command args, exit codes, describe_* API
#include "file_io.hpp"       // read_file(), write_file_atomic()
#include "pngme/parser.hpp"  // JSON output for --format json
#include "pngme/png.hpp"

#include <ostream>           // std::ostream for caller-provided output streams
#include <sstream>           // std::ostringstream: assemble describe_* blocks
#include <utility>


namespace pngme {
// ============================================================================
// Exit code mapping
// ============================================================================

int exit_code_for_file(Status s) {
    return s == Status::Ok ? EXIT_OK : EXIT_BAD_PNG;
}

int exit_code_for_lookup(Status s) {
    switch (s) {
        case Status::Ok:            return EXIT_OK;
        case Status::InvalidLength:
        case Status::InvalidTag:    return EXIT_BAD_TYPE;
        case Status::NotFound:      return EXIT_NOT_FOUND;
        case Status::NotUtf8:       return EXIT_NOT_UTF8;
        default:                    return EXIT_BAD_PNG;
    }
}

// ============================================================================
// Reporting helpers
// ---------------------------------------------------------------------------
// One line per failure on the error stream. Pretty and raw share the
// key=value form so scripts can grep either; json gets an error_json document.
// ============================================================================

static void report(const OutputOptions& opt, std::ostream& err, const Error& e, const std::string& path) {
    if (opt.format == Format::Json) {
        err << parser::error_json(e) << "\n";
        return;
    }
    err << opt.ansi.red("status=error") << " " << describe(e) << " file=" << path << "\n";
}

static void report_io(const OutputOptions& opt, std::ostream& err, const std::string& reason, const std::string& path) {
    if (opt.format == Format::Json) {
        err << parser::event_json("error", reason + " file=" + path) << "\n";
        return;
    }
    err << opt.ansi.red("status=error") << " reason=" << reason << " file=" << path << "\n";
}

// ---------------------------------------------------------------------------
// Load and parse a PNG. On failure the error is already reported and
// 'code' holds the exit code to return.
// ---------------------------------------------------------------------------
static bool load_png(const std::string& path, const OutputOptions& opt, std::ostream& err,
                     Png& png, int& code) {
    std::vector<uint8_t> bytes;
    std::string io_err;
    if (!read_file(path, bytes, io_err)) {
        report_io(opt, err, io_err, path);
        code = EXIT_IO;
        return false;
    }

    auto parsed = Png::parse(bytes);
    if (!parsed) {
        report(opt, err, parsed.error(), path);
        code = exit_code_for_file(parsed.status());
        return false;
    }
    png = parsed.take();
    return true;
}

static bool save_png(const std::string& path, const Png& png, const OutputOptions& opt,
                     std::ostream& err, int& code) {
    std::string io_err;
    if (!write_file_atomic(path, png.as_bytes(), io_err)) {
        report_io(opt, err, io_err, path);
        code = EXIT_IO;
        return false;
    }
    return true;
}

static std::string flag_summary(const ChunkType& t) {
    std::string s;
    s += t.is_critical() ? "critical" : "ancillary";
    s += t.is_public() ? ", public" : ", private";
    s += t.is_reserved_bit_valid() ? ", reserved-valid" : ", reserved-invalid";
    s += t.is_safe_to_copy() ? ", safe-to-copy" : ", unsafe-to-copy";
    return s;
}

// ============================================================================
// Dumps
// ============================================================================

std::string describe_chunk(const Chunk& chunk) {
    std::ostringstream os;
    os << "Chunk {\n";
    os << "  Length: " << chunk.length() << "\n";
    os << "  Type: " << chunk.chunk_type().to_string().c_str()
       << " (" << flag_summary(chunk.chunk_type()) << ")\n";
    os << "  Data: " << chunk.data().size() << " bytes\n";
    os << "  Crc: " << chunk.crc() << "\n";
    os << "}";
    return os.str();
}

std::string describe_chunk_type(const ChunkType& type) {
    auto yn = [](bool b) { return b ? "true" : "false"; };
    std::ostringstream os;
    os << "ChunkType {\n";
    os << "  Data: \"" << type.to_string().c_str() << "\"\n";
    os << "  Valid: " << yn(type.is_valid()) << "\n";
    os << "  Critical: " << yn(type.is_critical()) << "\n";
    os << "  Public: " << yn(type.is_public()) << "\n";
    os << "  Reserved valid: " << yn(type.is_reserved_bit_valid()) << "\n";
    os << "  Safe to copy: " << yn(type.is_safe_to_copy()) << "\n";
    os << "}";
    return os.str();
}

// ============================================================================
// Commands
// ============================================================================

// encode: type and message size are checked before the file is touched, so
// a bad argument never costs a read. The output file is only written after a clean parse.
int encode(const EncodeArgs& args, const OutputOptions& opt, std::ostream& out, std::ostream& err) {
    auto type = ChunkType::from_string(args.chunk_type);
    if (!type) {
        report(opt, err, type.error(), args.file_path);
        return exit_code_for_lookup(type.status());
    }

    if (!Chunk::fits_length(args.message.size())) {
        Error e;
        e.code     = Status::InvalidLength;
        e.expected = CHUNK_MAX_DATA;
        e.actual   = args.message.size();
        report(opt, err, e, args.file_path);
        return EXIT_BAD_TYPE;
    }

    Png png;
    int code = EXIT_OK;
    if (!load_png(args.file_path, opt, err, png, code)) return code;

    Chunk chunk(type.value(), std::vector<uint8_t>(args.message.begin(), args.message.end()));
    const uint32_t crc = chunk.crc();
    const uint32_t length = chunk.length();
    png.append_chunk(std::move(chunk));

    const std::string& target = args.output_file.empty() ? args.file_path : args.output_file;
    if (!save_png(target, png, opt, err, code)) return code;

    if (opt.format == Format::Json) {
        out << parser::event_json("ok", "encoded " + args.chunk_type + " into " + target) << "\n";
    } else if (opt.format == Format::Pretty) {
        out << opt.ansi.bold("status=ok") << " type=" << args.chunk_type
            << " length=" << length << " crc=" << crc
            << " chunks=" << png.chunks().size() << " file=" << target << "\n";
    }
    return EXIT_OK;
}

int decode(const DecodeArgs& args, const OutputOptions& opt, std::ostream& out, std::ostream& err) {
    Png png;
    int code = EXIT_OK;
    if (!load_png(args.file_path, opt, err, png, code)) return code;

    auto found = png.chunk_by_type(args.chunk_type);
    if (!found) {
        report(opt, err, found.error(), args.file_path);
        return exit_code_for_lookup(found.status());
    }
    const Chunk* chunk = found.value();
    if (!chunk) {
        Error e;
        e.code = Status::NotFound;
        report(opt, err, e, args.file_path);
        return EXIT_NOT_FOUND;
    }

    if (opt.format == Format::Raw) {
        out.write(reinterpret_cast<const char*>(chunk->data().data()),
                  static_cast<std::streamsize>(chunk->data().size()));
        return EXIT_OK;
    }
    if (opt.format == Format::Json) {
        out << parser::to_json(*chunk, 2) << "\n";
        return EXIT_OK;
    }

    auto text = chunk->data_as_string();
    if (!text) {
        report(opt, err, text.error(), args.file_path);
        return exit_code_for_lookup(text.status());
    }
    out << text.value() << "\n";
    return EXIT_OK;
}

int remove(const RemoveArgs& args, const OutputOptions& opt, std::ostream& out, std::ostream& err) {
    Png png;
    int code = EXIT_OK;
    if (!load_png(args.file_path, opt, err, png, code)) return code;

    auto removed = png.remove_chunk(args.chunk_type);
    if (!removed) {
        report(opt, err, removed.error(), args.file_path);
        return exit_code_for_lookup(removed.status());
    }

    if (!save_png(args.file_path, png, opt, err, code)) return code;

    if (opt.format == Format::Json) {
        out << parser::to_json(removed.value(), 2) << "\n";
    } else if (opt.format == Format::Pretty) {
        out << opt.ansi.bold("status=ok") << " removed=" << args.chunk_type
            << " length=" << removed.value().length()
            << " chunks=" << png.chunks().size() << " file=" << args.file_path << "\n";
    }
    return EXIT_OK;
}

int print_chunks(const PrintArgs& args, const OutputOptions& opt, std::ostream& out, std::ostream& err) {
    Png png;
    int code = EXIT_OK;
    if (!load_png(args.file_path, opt, err, png, code)) return code;

    switch (opt.format) {
        case Format::Json:
            out << parser::to_json(png, 2) << "\n";
            break;
        case Format::Raw:
            for (const auto& c : png.chunks()) {
                out << c.chunk_type().to_string().c_str() << " " << c.length() << " " << c.crc() << "\n";
            }
            break;
        case Format::Pretty:
            out << opt.ansi.dim(args.file_path + ": " + std::to_string(png.chunks().size()) + " chunk(s)") << "\n";
            for (const auto& c : png.chunks()) {
                out << describe_chunk(c) << "\n";
            }
            break;
    }
    return EXIT_OK;
}

} // namespace pngme
