#ifndef SPVBIN_PARSER_DECODE_ERROR_HPP
#define SPVBIN_PARSER_DECODE_ERROR_HPP

#include "../grammar/operand_kinds.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>

namespace spvbin
{
  // Raised by the word cursor and the operand decoder.  The parser catches
  // these at its two boundaries (header and operands) and wraps them into
  // a parse_result; they never escape parse().
  struct decode_error : std::exception {
    enum class code {
      // fewer than four bytes left for the next word
      STREAM_EXPECTED,
      // the current instruction's word window is drained
      LIMIT_REACHED,
      // an enumerant value (or bit) the grammar does not define
      ENUMERANT_UNKNOWN,
      // a context-dependent literal wider than 64b
      LITERAL_WIDTH_UNSUPPORTED,
    };

    code                          err;
    size_t                        offset; // byte offset into the module
    std::optional<operand_kind>   kind;
    uint32_t                      value = 0;
    std::string                   message;

    decode_error(
      code c,
      size_t off,
      std::optional<operand_kind> k = std::nullopt,
      uint32_t val = 0);

    static decode_error stream_expected(size_t off) {
      return decode_error(code::STREAM_EXPECTED, off);
    }
    static decode_error limit_reached(size_t off) {
      return decode_error(code::LIMIT_REACHED, off);
    }
    static decode_error enumerant_unknown(
      size_t off, operand_kind k, uint32_t val)
    {
      return decode_error(code::ENUMERANT_UNKNOWN, off, k, val);
    }
    static decode_error literal_width_unsupported(
      size_t off, operand_kind k, uint32_t words)
    {
      return decode_error(code::LITERAL_WIDTH_UNSUPPORTED, off, k, words);
    }

    const char *what() const noexcept override {return message.c_str();}
    const std::string &str() const {return message;}

    bool operator==(const decode_error &rhs) const {
      return err == rhs.err && offset == rhs.offset &&
        kind == rhs.kind && value == rhs.value;
    }
  }; // decode_error

  const char *to_syntax(decode_error::code c);
} // namespace spvbin

#endif
