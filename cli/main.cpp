/**
 * @file main.cpp
 * @brief pngme CLI: hide, read, and strip text messages in PNG chunks.
 *
 * Responsibilities:
 *  - Parse subcommands and options (CLI11).
 *  - Decide output styling (ANSI only on a TTY in pretty mode, never with --no-color).
 *  - Hand off to the commands layer and return its exit code.
 *
 * Usage:
 *   pngme encode <file> <type> <message> [output]
 *   pngme decode <file> <type>
 *   pngme remove <file> <type>
 *   pngme print  <file>
 *
 * Global options (before the subcommand):
 *   --format pretty|json|raw   output style (default pretty)
 *   --no-color                 disable ANSI styling
 *
 * Exit codes are listed in commands.hpp.
 */

#include <cstdio>
#include <iostream>
#include <string>

#include <unistd.h> // isatty

#include <CLI/CLI.hpp>

#include "commands.hpp"

using namespace pngme;

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

int main(int argc, char** argv) {
  std::string opt_format = "pretty"; // pretty|json|raw
  bool opt_no_color = false;

  CLI::App app{"pngme: hide messages in PNG chunks"};
  app.require_subcommand(1);

  app.add_option("--format", opt_format, "Output format: pretty|json|raw")
      ->check(CLI::IsMember({"pretty", "json", "raw"}))
      ->capture_default_str();
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  // ---- encode ----
  EncodeArgs enc;
  auto cmd_encode = app.add_subcommand("encode", "Append a message chunk to a PNG");
  cmd_encode->add_option("file", enc.file_path, "PNG file")->required();
  cmd_encode->add_option("chunk_type", enc.chunk_type, "4-letter chunk type, e.g. ruSt")->required();
  cmd_encode->add_option("message", enc.message, "Message text")->required();
  cmd_encode->add_option("output", enc.output_file, "Write here instead of overwriting <file>");

  // ---- decode ----
  DecodeArgs dec;
  auto cmd_decode = app.add_subcommand("decode", "Print the message stored in a chunk");
  cmd_decode->add_option("file", dec.file_path, "PNG file")->required();
  cmd_decode->add_option("chunk_type", dec.chunk_type, "4-letter chunk type")->required();

  // ---- remove ----
  RemoveArgs rem;
  auto cmd_remove = app.add_subcommand("remove", "Remove the first chunk of a type");
  cmd_remove->add_option("file", rem.file_path, "PNG file")->required();
  cmd_remove->add_option("chunk_type", rem.chunk_type, "4-letter chunk type")->required();

  // ---- print ----
  PrintArgs prn;
  auto cmd_print = app.add_subcommand("print", "List every chunk of a PNG");
  cmd_print->add_option("file", prn.file_path, "PNG file")->required();

  CLI11_PARSE(app, argc, argv);

  OutputOptions opt;
  if (opt_format == "json")     opt.format = Format::Json;
  else if (opt_format == "raw") opt.format = Format::Raw;
  else                          opt.format = Format::Pretty;
  opt.ansi.enabled = !opt_no_color && is_tty_stdout() && opt.format == Format::Pretty;

  if (*cmd_encode) return pngme::encode(enc, opt, std::cout, std::cerr);
  if (*cmd_decode) return pngme::decode(dec, opt, std::cout, std::cerr);
  if (*cmd_remove) return pngme::remove(rem, opt, std::cout, std::cerr);
  if (*cmd_print)  return pngme::print_chunks(prn, opt, std::cout, std::cerr);

  std::cerr << "status=error reason=need_exactly_one_command\n";
  return 2;
}
