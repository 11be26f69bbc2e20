/**
 * @page pngme-commands pngme Commands Layer
 * @file commands.hpp
 * @brief encode / decode / remove / print: the operations behind the `pngme` command line.
 * @details
 * PURPOSE
 * -------
 * The commands layer is the glue between the shell and the codec. Each command:
 *   1. reads a PNG from disk (file_io.hpp),
 *   2. parses it (pngme::Png::parse),
 *   3. inspects or edits its chunk list,
 *   4. writes the result back or prints what was asked for,
 *   5. returns a process exit code.
 *
 * Nothing here knows about argv; cli/main.cpp fills the *Args structs with CLI11
 * and forwards them. Output goes to caller-provided streams so tests can capture it.
 *
 * COMMANDS
 * --------
 *   encode <file> <type> <message> [output]  append Chunk(type, message), save to output or file
 *   decode <file> <type>                     print the first <type> chunk as text
 *   remove <file> <type>                     drop the first <type> chunk, save to file
 *   print  <file>                            list every chunk
 *
 * OUTPUT FORMATS
 * --------------
 *   pretty  human-readable blocks; `status=ok ...` summary for encode/remove
 *   json    one nlohmann::json document per call (parser.hpp)
 *   raw     decode: payload bytes verbatim; print: `<type> <length> <crc>` per line
 *
 * Errors always go to the error stream, as `status=error reason=<name> ... file=<path>`
 * (pretty/raw) or as an error_json() document (json).
 *
 * EXIT CODES
 * ----------
 *   0  ok
 *   1  file could not be read or written
 *   2  <type> argument is not a chunk type (invalid_length / invalid_tag), or
 *      <message> is longer than a chunk can hold (invalid_length)
 *   3  file is not a well-formed PNG chunk stream
 *   4  no chunk of <type> (not_found)
 *   5  chunk payload is not UTF-8 text (not_utf8)
 */

#pragma once
#include <iosfwd>
#include <string>
#include <cstdint>

#include "pngme/chunk.hpp"
#include "pngme/chunk_type.hpp"
#include "pngme/result.hpp"

namespace pngme {

// ============================== Exit codes ===========================
enum : int {
    EXIT_OK        = 0,  /**< Command completed. */
    EXIT_IO        = 1,  /**< read_file / write_file_atomic failed. */
    EXIT_BAD_TYPE  = 2,  /**< Chunk type or message argument rejected. */
    EXIT_BAD_PNG   = 3,  /**< Png::parse failed. */
    EXIT_NOT_FOUND = 4,  /**< No chunk of the requested type. */
    EXIT_NOT_UTF8  = 5   /**< Payload requested as text is not UTF-8. */
};

/// Output style shared by all commands.
enum class Format : uint8_t { Pretty, Json, Raw };

/// ANSI styling; every helper is a no-op when disabled.
struct Ansi {
    bool enabled{false};
    std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
    std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
    std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

struct OutputOptions {
    Format format{Format::Pretty};
    Ansi   ansi{};
};

struct EncodeArgs {
    std::string file_path;
    std::string chunk_type;
    std::string message;
    std::string output_file;   ///< empty: overwrite file_path
};

struct DecodeArgs {
    std::string file_path;
    std::string chunk_type;
};

struct RemoveArgs {
    std::string file_path;
    std::string chunk_type;
};

struct PrintArgs {
    std::string file_path;
};

/// Append a message chunk and save the PNG.
int encode(const EncodeArgs& args, const OutputOptions& opt, std::ostream& out, std::ostream& err);

/// Print the first chunk of a type as text.
int decode(const DecodeArgs& args, const OutputOptions& opt, std::ostream& out, std::ostream& err);

/// Remove the first chunk of a type and save the PNG.
int remove(const RemoveArgs& args, const OutputOptions& opt, std::ostream& out, std::ostream& err);

/// List every chunk of a PNG.
int print_chunks(const PrintArgs& args, const OutputOptions& opt, std::ostream& out, std::ostream& err);

/**
 * @brief Multi-line dump of a chunk.
 *
 * @code
 * Chunk {
 *   Length: 42
 *   Type: RuSt (critical, private, reserved-valid, safe-to-copy)
 *   Data: 42 bytes
 *   Crc: 2882656334
 * }
 * @endcode
 */
std::string describe_chunk(const Chunk& chunk);

/// Multi-line dump of a chunk type with each property on its own line.
std::string describe_chunk_type(const ChunkType& type);

/// Exit code for a failed Png::parse.
int exit_code_for_file(Status s);

/// Exit code for a failed lookup or type argument.
int exit_code_for_lookup(Status s);

} // namespace pngme
