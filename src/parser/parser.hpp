#ifndef SPVBIN_PARSER_PARSER_HPP
#define SPVBIN_PARSER_PARSER_HPP

#include "../grammar/grammar_table.hpp"
#include "../ir/module.hpp"
#include "../text.hpp"
#include "decode_error.hpp"
#include "operand_decoder.hpp"
#include "word_cursor.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace spvbin
{
  ///////////////////////////////////////////////////////////////////////////
  // What a consumer tells the parser after each callback.
  struct action {
    enum code {CONTINUE, STOP, ERROR} what;
    std::string cause; // only for ERROR

    action(code c) : what(c) { }
    action(code c, std::string _cause) : what(c), cause(std::move(_cause)) { }

    static action error(std::string why) {return action(ERROR, std::move(why));}

    bool is_continue() const {return what == CONTINUE;}
  }; // action

  // The parser pushes the module into one of these.  Callbacks arrive in
  // order: initialize, consume_header, consume_instruction*, finalize.
  // Anything other than CONTINUE ends the parse with no further calls.
  struct consumer {
    virtual ~consumer() { }

    virtual action initialize() = 0;
    virtual action finalize() = 0;
    virtual action consume_header(module_header h) = 0;
    virtual action consume_instruction(instruction inst) = 0;
  }; // consumer

  ///////////////////////////////////////////////////////////////////////////
  // The single outcome of a parse.  Offsets are byte offsets into the
  // input; instruction indices are 1-based.
  struct parse_result {
    enum class state {
      COMPLETE = 0,
      CONSUMER_STOP_REQUESTED,
      CONSUMER_ERROR,
      HEADER_INCOMPLETE,
      HEADER_INCORRECT,
      ENDIANNESS_UNSUPPORTED,
      INSTRUCTION_INCOMPLETE,
      WORD_COUNT_ZERO,
      OPCODE_UNKNOWN,
      OPERAND_EXPECTED,
      OPERAND_EXCEEDED,
      OPERAND_ERROR,
    } st = state::COMPLETE;

    // also set for a CONSUMER_* answer to consume_instruction
    size_t                        offset = 0;
    size_t                        index = 0;
    uint16_t                      opcode = 0;
    // HEADER_INCOMPLETE and OPERAND_ERROR
    std::optional<decode_error>   cause;
    // CONSUMER_ERROR
    std::string                   consumer_cause;

    parse_result() { }
    explicit parse_result(state s) : st(s) { }

    static parse_result at(state s, size_t off, size_t ix) {
      parse_result r(s);
      r.offset = off;
      r.index = ix;
      return r;
    }
    static parse_result opcode_unknown(size_t off, size_t ix, uint16_t op) {
      parse_result r = at(state::OPCODE_UNKNOWN, off, ix);
      r.opcode = op;
      return r;
    }
    static parse_result decode_failed(state s, const decode_error &e) {
      parse_result r(s);
      r.offset = e.offset;
      r.cause = e;
      return r;
    }
    static parse_result consumer_error(std::string why) {
      parse_result r(state::CONSUMER_ERROR);
      r.consumer_cause = std::move(why);
      return r;
    }

    bool succeeded() const {return st == state::COMPLETE;}
    bool stopped() const {return st == state::CONSUMER_STOP_REQUESTED;}

    // a short fixed phrase: e.g. "unknown opcode"
    const char *description() const;
    // a full one-line message:
    // e.g. "unknown opcode (4660) for instruction #2 at offset 20"
    std::string str() const;
  }; // parse_result

  const char *to_syntax(parse_result::state s);

  ///////////////////////////////////////////////////////////////////////////
  // Parses one module and drives a consumer.  A parser is good for one
  // call to parse().
  class parser {
    const std::vector<uint8_t>  bits;
    word_cursor                 cursor;
    consumer                   &sink;
    int                         verbosity;
    size_t                      inst_index = 0;

  public:
    parser(std::vector<uint8_t> binary, consumer &c, int _verbosity = 0)
      : bits(std::move(binary)), cursor(bits), sink(c), verbosity(_verbosity)
    { }
    parser(const parser &) = delete;
    parser &operator=(const parser &) = delete;

    parse_result parse();

  private:
    std::optional<parse_result> parse_header();
    std::optional<parse_result> parse_inst();
    std::optional<parse_result> parse_operands(
      const instruction_grammar &g, instruction &inst);

    void trace_inst(size_t inst_off, uint16_t wc, const instruction &inst) const;

    template <typename...Ts>
    void debug(Ts...ts) const {
      if (debugging())
        std::cout << text::format(ts...);
    }
    bool debugging() const {return verbosity > 1;}
  }; // class parser

  // Parses a complete module from a byte buffer (words little-endian).
  // Malformed input is reported through the result, never thrown.
  parse_result parse(
    std::vector<uint8_t> binary,
    consumer &sink,
    int verbosity = 0);
} // namespace spvbin

#endif
