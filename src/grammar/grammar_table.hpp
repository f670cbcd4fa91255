#ifndef SPVBIN_GRAMMAR_TABLE_HPP
#define SPVBIN_GRAMMAR_TABLE_HPP

#include "operand_kinds.hpp"

#include <cstdint>
#include <vector>

namespace spvbin
{
  enum class quantifier {
    ONE,          // exactly one
    ZERO_OR_ONE,  // '?'
    ZERO_OR_MORE, // '*' (trailing variadic list)
  };

  struct logical_operand {
    operand_kind kind;
    quantifier   quant;
  };

  struct instruction_grammar {
    const char                   *opname;
    uint16_t                      opcode;
    std::vector<logical_operand>  operands;

    bool has_result_type() const {
      return !operands.empty() && operands[0].kind == operand_kind::IdResultType;
    }
    bool has_result() const {
      for (const auto &lo : operands)
        if (lo.kind == operand_kind::IdResult)
          return true;
      return false;
    }
  };

  // returns nullptr for an opcode we have no grammar for
  const instruction_grammar                *lookup_opcode(uint16_t opcode);
  const std::vector<instruction_grammar>   &all_instructions();

  // "OpTypeInt" or "Op???" for unknown opcodes
  const char                               *opcode_name(uint16_t opcode);
} // namespace spvbin

#endif
