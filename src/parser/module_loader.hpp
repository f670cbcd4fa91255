#ifndef SPVBIN_PARSER_MODULE_LOADER_HPP
#define SPVBIN_PARSER_MODULE_LOADER_HPP

#include "../fatal.hpp"
#include "../ir/module.hpp"
#include "parser.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace spvbin
{
  // A consumer that sorts instructions into a module's logical layout
  // sections and groups function bodies into basic blocks.
  //
  // Structural problems (e.g. an OpLabel outside a function) end the
  // parse with CONSUMER_ERROR.
  class module_loader : public consumer {
    module                 &m;
    // 0 means no limit; otherwise STOP on any instruction past this many
    size_t                  max_instructions;
    function               *curr_function = nullptr;
    basic_block            *curr_block = nullptr;

  public:
    explicit module_loader(module &_m, size_t max_insts = 0)
      : m(_m), max_instructions(max_insts) { }

    size_t instructions_loaded() const {return m.instructions.size();}

    action initialize() override;
    action finalize() override;
    action consume_header(module_header h) override;
    action consume_instruction(instruction inst) override;

  private:
    action add_to_function(instruction &&inst);
  }; // module_loader

  // parse and load a module; m is only meaningful on success
  parse_result load_bytes(
    std::vector<uint8_t> binary, module &m, int verbosity = 0);
  // the same from words (serialized little-endian)
  parse_result load_words(
    const std::vector<uint32_t> &words, module &m, int verbosity = 0);

  // Loads the module in diags.input() (read from diags.path()).
  // A parse failure is thrown as a diagnostic located at the failing
  // instruction; a non-zero reserved header word becomes a warning.
  // A non-zero max_instructions stops loading early (not an error);
  // stopped_early (if given) says whether that limit cut the module short.
  module load_module(
    diagnostics &diags,
    size_t max_instructions = 0,
    bool *stopped_early = nullptr);

  // converts a failed result to a diagnostic location
  loc location_of(const parse_result &r, const std::vector<uint8_t> &bits);
} // namespace spvbin

#endif
