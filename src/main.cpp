#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "fatal.hpp"
#include "ir/module.hpp"
#include "opts.hpp"
#include "parser/module_loader.hpp"
#include "spvbin_opts.hpp"
#include "stats.hpp"
#include "system.hpp"
#include "text.hpp"

#ifndef SPVBIN_VERSION_STRING
#define SPVBIN_VERSION_STRING "0.1.0"
#endif
#ifndef SPVBIN_EXE
#define SPVBIN_EXE "spvbin"
#endif

// main-format-stats.cpp
void emit_stats(
  const spvbin::opts &os, const std::string &file, const spvbin::module_stats &ms);

static bool run_file(const spvbin::opts &os, const std::string &file);

int main(int argc, const char **argv)
{
  spvbin::opts os;
  opts::CmdlineSpec<spvbin::opts> cmdspec(
    "SPIR-V Binary Inspector " SPVBIN_VERSION_STRING " (" __DATE__ ")",
    SPVBIN_EXE,
    "  % " SPVBIN_EXE " kernel.spv\n"
    "    decodes kernel.spv and prints a one line summary\n"
    "  % " SPVBIN_EXE " -d kernel.spv\n"
    "    dumps the module section by section\n"
    "  % " SPVBIN_EXE " -s -n=100 kernel.spv\n"
    "    shows opcode statistics for the first 100 instructions\n"
  );
  cmdspec.defineArg(
    "FILE", "a SPIR-V binary module",
    "A SPIR-V module in binary form (little-endian words).",
    opts::ALLOW_MULTI|opts::REQUIRED,
    os.input_files);

  cmdspec.defineFlag(
    "d", "dump",
    "dumps the decoded module",
    "Prints every instruction grouped by logical layout section "
    "(capabilities, debug, annotations, types, functions ...).",
    opts::NONE,
    os.dump_module);
  cmdspec.defineOpt(
    "n", "max-instructions", "INT",
    "stops after this many instructions",
    "Decoding stops (successfully) once this many instructions have "
    "been loaded.  The default 0 decodes the whole module.",
    opts::NONE,
    [] (const char *value, const opts::ErrorHandler &eh, spvbin::opts &os) {
      int n = 0;
      if (!opts::readDecInt(value, n) || n < 0) {
        eh("-n: malformed instruction count");
      }
      os.max_instructions = (size_t)n;
    });
  cmdspec.defineFlag(
    "s", "stats",
    "shows opcode statistics",
    "Lists each opcode used with its frequency and operand counts.",
    opts::NONE,
    os.show_stats);
  cmdspec.defineFlag(
      "q", "quiet", "lower verbosity", "generate minimal output", opts::NONE,
      [] (const char *, const opts::ErrorHandler &, spvbin::opts &os) {
          os.verbosity = -1;
          sys::desired_message_verbosity = 2;
      });
  cmdspec.defineOpt(
      "v",
      "verbosity",
      "INT",
      "sets the output level",
      "Level 1 reports progress; level 2 traces every decoded instruction "
      "with its raw words.",
      opts::FLAG_VALUE,
    [] (const char *value, const opts::ErrorHandler &eh, spvbin::opts &opts) {
      if (*value == 0) { // -v
        opts.verbosity = 1;
      } else if (!opts::readDecInt(value, opts.verbosity)) {
        eh("malformed verbosity value");
      }
      sys::desired_message_verbosity = -opts.verbosity;
    });

  if (!cmdspec.parse(argc, argv, os)) {
    exit(EXIT_FAILURE);
  }

  bool all_ok = true;
  for (const std::string &file : os.input_files) {
    all_ok &= run_file(os, file);
  }

  // funky stuff happens with ANSI coloring without explicit flushing
  std::cout.flush();
  std::cerr.flush();

  return all_ok ? EXIT_SUCCESS : EXIT_FAILURE;
}

static bool run_file(const spvbin::opts &os, const std::string &file)
{
  if (!sys::file_exists(file)) {
    std::cerr << text::spans::RED(file) << ": file not found\n";
    return false;
  }
  const sys::bits bits = sys::read_file_binary(file);
  DEBUG("%s: read %d bytes", file.c_str(), (int)bits.size());

  spvbin::diagnostics ds(os.verbosity, file, bits);
  spvbin::module m;
  bool limited = false;
  try {
    VERBOSE("============ decoding %s (%d B)",
      file.c_str(), (int)bits.size());
    m = spvbin::load_module(ds, os.max_instructions, &limited);
    ds.flush_warnings(std::cerr);
  } catch (const spvbin::diagnostic &d) {
    ds.flush_warnings(std::cerr);
    if (d.level == spvbin::diagnostic::INTERNAL)
      d.emit_and_exit_with_error();
    d.str(std::cerr);
    return false;
  }

  if (!os.quiet()) {
    std::cout << text::ANSI_WHITE << file << text::ANSI_RESET << ": ";
    if (m.header)
      std::cout << "SPIR-V " << m.header->major_version() << "." <<
        m.header->minor_version() << ", bound " << m.header->bound << ", ";
    std::cout << m.instructions.size() << " instructions, " <<
      m.functions.size() << " functions\n";
  }
  if (os.dump_module) {
    m.str(std::cout);
  }
  if (limited) {
    WARNING("%s: decoding limited to %d instructions (-n)",
      file.c_str(), (int)m.instructions.size());
  }
  if (os.show_stats) {
    emit_stats(os, file, spvbin::module_stats(m, bits.size()));
  }
  return true;
}
