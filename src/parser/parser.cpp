#include "parser.hpp"
#include "../grammar/spirv.hpp"

#include <sstream>

using namespace spvbin;

const char *spvbin::to_syntax(parse_result::state s)
{
  using S = parse_result::state;
  switch (s) {
  case S::COMPLETE:                 return "COMPLETE";
  case S::CONSUMER_STOP_REQUESTED:  return "CONSUMER_STOP_REQUESTED";
  case S::CONSUMER_ERROR:           return "CONSUMER_ERROR";
  case S::HEADER_INCOMPLETE:        return "HEADER_INCOMPLETE";
  case S::HEADER_INCORRECT:         return "HEADER_INCORRECT";
  case S::ENDIANNESS_UNSUPPORTED:   return "ENDIANNESS_UNSUPPORTED";
  case S::INSTRUCTION_INCOMPLETE:   return "INSTRUCTION_INCOMPLETE";
  case S::WORD_COUNT_ZERO:          return "WORD_COUNT_ZERO";
  case S::OPCODE_UNKNOWN:           return "OPCODE_UNKNOWN";
  case S::OPERAND_EXPECTED:         return "OPERAND_EXPECTED";
  case S::OPERAND_EXCEEDED:         return "OPERAND_EXCEEDED";
  case S::OPERAND_ERROR:            return "OPERAND_ERROR";
  default:                          return "???";
  }
}

const char *parse_result::description() const
{
  switch (st) {
  case state::COMPLETE:                 return "completed parsing";
  case state::CONSUMER_STOP_REQUESTED:  return "stop parsing requested by consumer";
  case state::CONSUMER_ERROR:           return "consumer error";
  case state::HEADER_INCOMPLETE:        return "incomplete module header";
  case state::HEADER_INCORRECT:         return "incorrect module header";
  case state::ENDIANNESS_UNSUPPORTED:   return "unsupported endianness";
  case state::INSTRUCTION_INCOMPLETE:   return "incomplete instruction";
  case state::WORD_COUNT_ZERO:          return "zero word count found";
  case state::OPCODE_UNKNOWN:           return "unknown opcode";
  case state::OPERAND_EXPECTED:         return "expected more operands";
  case state::OPERAND_EXCEEDED:         return "found extra operands";
  case state::OPERAND_ERROR:            return "operand decoding error";
  default:                              return "???";
  }
}

std::string parse_result::str() const
{
  std::stringstream ss;
  switch (st) {
  case state::CONSUMER_ERROR:
    ss << description() << ": " << consumer_cause;
    break;
  case state::HEADER_INCOMPLETE:
  case state::OPERAND_ERROR:
    ss << description();
    if (cause)
      ss << ": " << cause->str();
    break;
  case state::INSTRUCTION_INCOMPLETE:
    ss << "incomplete instruction #" << index << " at offset " << offset;
    break;
  case state::WORD_COUNT_ZERO:
    ss << "zero word count found for instruction #" << index <<
      " at offset " << offset;
    break;
  case state::OPCODE_UNKNOWN:
    ss << "unknown opcode (" << opcode << ") for instruction #" << index <<
      " at offset " << offset;
    break;
  case state::OPERAND_EXPECTED:
    ss << "expected more operands for instruction #" << index <<
      " at offset " << offset;
    break;
  case state::OPERAND_EXCEEDED:
    ss << "found extra operands for instruction #" << index <<
      " at offset " << offset;
    break;
  default:
    ss << description();
    break;
  }
  return ss.str();
}

///////////////////////////////////////////////////////////////////////////////
// maps a consumer's answer onto a terminal state (or nothing to continue)
static std::optional<parse_result> check_action(const action &a)
{
  switch (a.what) {
  case action::CONTINUE:
    return std::nullopt;
  case action::STOP:
    return parse_result(parse_result::state::CONSUMER_STOP_REQUESTED);
  default:
    return parse_result::consumer_error(a.cause);
  }
}

parse_result parser::parse()
{
  if (auto r = check_action(sink.initialize()))
    return *r;

  if (auto r = parse_header())
    return *r;

  // fewer than four bytes left cannot start an instruction; a ragged tail
  // ends the stream like an exact end does
  while (cursor.bytes_left() >= sizeof(uint32_t)) {
    if (auto r = parse_inst())
      return *r;
  }

  if (auto r = check_action(sink.finalize()))
    return *r;
  return parse_result(parse_result::state::COMPLETE);
}

std::optional<parse_result> parser::parse_header()
{
  std::vector<uint32_t> ws;
  try {
    ws = cursor.next_words(spv::HEADER_WORDS);
  } catch (const decode_error &e) {
    return parse_result::decode_failed(
      parse_result::state::HEADER_INCOMPLETE, e);
  }

  if (ws[0] != spv::MAGIC_NUMBER) {
    if (ws[0] == word_cursor::swap_byte_order(spv::MAGIC_NUMBER))
      return parse_result(parse_result::state::ENDIANNESS_UNSUPPORTED);
    return parse_result(parse_result::state::HEADER_INCORRECT);
  }

  // the reserved (schema) word is passed through unchecked
  module_header h(ws[0], ws[1], ws[2], ws[3], ws[4]);
  debug("version: ", h.major_version(), ".", h.minor_version(), "\n");
  debug("generator: 0x", text::hex(h.generator), "\n");
  debug("bound: ", h.bound, "\n");
  debug("schema: ", h.reserved, "\n");

  return check_action(sink.consume_header(h));
}

std::optional<parse_result> parser::parse_inst()
{
  inst_index++;
  const size_t inst_off = cursor.offset();

  const uint32_t first = cursor.next_word();
  const uint16_t wc = (uint16_t)(first >> 16);
  const uint16_t opcode = (uint16_t)(first & 0xFFFF);
  if (wc == 0)
    return parse_result::at(
      parse_result::state::WORD_COUNT_ZERO, inst_off, inst_index);

  const instruction_grammar *g = lookup_opcode(opcode);
  if (g == nullptr)
    return parse_result::opcode_unknown(inst_off, inst_index, opcode);

  if (cursor.bytes_left() / sizeof(uint32_t) < (size_t)wc - 1)
    return parse_result::at(
      parse_result::state::INSTRUCTION_INCOMPLETE, inst_off, inst_index);

  instruction inst(opcode);
  cursor.set_limit((size_t)wc - 1);
  try {
    if (auto r = parse_operands(*g, inst))
      return r;
  } catch (const decode_error &e) {
    cursor.clear_limit();
    return parse_result::decode_failed(
      parse_result::state::OPERAND_ERROR, e);
  }
  if (!cursor.limit_reached())
    return parse_result::at(
      parse_result::state::OPERAND_EXCEEDED, cursor.offset(), inst_index);
  cursor.clear_limit();

  if (debugging())
    trace_inst(inst_off, wc, inst);

  auto r = check_action(sink.consume_instruction(std::move(inst)));
  if (r) {
    // locate the consumer's answer at the instruction it was given
    r->offset = inst_off;
    r->index = inst_index;
  }
  return r;
}

std::optional<parse_result> parser::parse_operands(
  const instruction_grammar &g, instruction &inst)
{
  operand_decoder decoder(cursor);

  size_t i = 0;
  while (i < g.operands.size()) {
    const logical_operand &lo = g.operands[i];
    if (cursor.limit_reached()) {
      // trailing optional or variadic operands may be absent
      if (lo.quant == quantifier::ONE)
        return parse_result::at(
          parse_result::state::OPERAND_EXPECTED, cursor.offset(), inst_index);
      break;
    }

    if (lo.kind == operand_kind::IdResultType) {
      inst.result_type = cursor.next_identifier();
    } else if (lo.kind == operand_kind::IdResult) {
      inst.result_id = cursor.next_identifier();
    } else {
      decoder.decode_into(lo.kind, inst.operands);
    }

    // a '*' operand repeats until the window is drained
    if (lo.quant != quantifier::ZERO_OR_MORE)
      i++;
  }
  return std::nullopt;
}

void parser::trace_inst(
  size_t inst_off, uint16_t wc, const instruction &inst) const
{
  std::stringstream ss;
  ss << "0x" << text::hex(inst_off, 5) << ": ";
  inst.str(ss);
  ss << "\n        ";
  for (size_t w = 0; w < wc; w++) {
    word_cursor raw(bits.data() + inst_off + w * sizeof(uint32_t),
      sizeof(uint32_t));
    ss << " " << text::hex(raw.next_word(), 8);
  }
  ss << "\n";
  std::cout << ss.str();
}

parse_result spvbin::parse(
  std::vector<uint8_t> binary,
  consumer &sink,
  int verbosity)
{
  parser p(std::move(binary), sink, verbosity);
  return p.parse();
}
