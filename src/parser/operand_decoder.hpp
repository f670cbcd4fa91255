#ifndef SPVBIN_PARSER_OPERAND_DECODER_HPP
#define SPVBIN_PARSER_OPERAND_DECODER_HPP

#include "../grammar/operand_kinds.hpp"
#include "../ir/module.hpp"
#include "word_cursor.hpp"

#include <vector>

namespace spvbin {

  // Decodes one logical operand into one or more concrete operands.
  // A pair kind yields two operands.  An enumerant that mandates
  // parameters yields itself followed by those parameters.
  //
  // Failures are thrown as decode_error; the cursor may have moved.
  class operand_decoder {
    word_cursor &cursor;

  public:
    explicit operand_decoder(word_cursor &c) : cursor(c) { }

    std::vector<operand> decode(operand_kind k);
    void decode_into(operand_kind k, std::vector<operand> &ops);

  private:
    void decode_number(const operand_kind_info &oki, std::vector<operand> &ops);
    void decode_value_enum(const operand_kind_info &oki, std::vector<operand> &ops);
    void decode_bit_enum(const operand_kind_info &oki, std::vector<operand> &ops);
  }; // class operand_decoder
}

#endif
