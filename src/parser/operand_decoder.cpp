#include "operand_decoder.hpp"

using namespace spvbin;

std::vector<operand> operand_decoder::decode(operand_kind k)
{
  std::vector<operand> ops;
  decode_into(k, ops);
  return ops;
}

void operand_decoder::decode_into(operand_kind k, std::vector<operand> &ops)
{
  const operand_kind_info &oki = lookup_operand_kind(k);
  switch (oki.category) {
  case operand_category::ID:
    ops.push_back(operand::id(k, cursor.next_identifier()));
    break;
  case operand_category::LITERAL_NUMBER:
    decode_number(oki, ops);
    break;
  case operand_category::LITERAL_STRING:
    ops.push_back(operand::string(k, cursor.next_string()));
    break;
  case operand_category::VALUE_ENUM:
    decode_value_enum(oki, ops);
    break;
  case operand_category::BIT_ENUM:
    decode_bit_enum(oki, ops);
    break;
  case operand_category::COMPOSITE:
    for (operand_kind m : oki.members)
      decode_into(m, ops);
    break;
  }
}

void operand_decoder::decode_number(
  const operand_kind_info &oki, std::vector<operand> &ops)
{
  // context-dependent literals (OpConstant, OpSpecConstant) take whatever
  // the instruction has left; the result type decides the width and we
  // only have the word count to go on
  uint32_t words = oki.literal_words;
  if (words == 0) {
    words = (uint32_t)cursor.limit_remaining();
    if (words == 0)
      words = 1; // let the cursor report the exhaustion
  }

  if (words == 1) {
    ops.push_back(operand::number32(oki.kind, cursor.next_word()));
  } else if (words == 2) {
    // low-order word first
    auto ws = cursor.next_words(2);
    ops.push_back(operand::number64(
      oki.kind, (uint64_t)ws[0] | ((uint64_t)ws[1] << 32)));
  } else {
    throw decode_error::literal_width_unsupported(
      cursor.offset(), oki.kind, words);
  }
}

void operand_decoder::decode_value_enum(
  const operand_kind_info &oki, std::vector<operand> &ops)
{
  const size_t at = cursor.offset();
  const uint32_t val = cursor.next_word();
  const enumerant *e = find_enumerant(oki, val);
  if (!e)
    throw decode_error::enumerant_unknown(at, oki.kind, val);

  ops.push_back(operand::enum_value(oki.kind, val));
  for (operand_kind p : e->parameters)
    decode_into(p, ops);
}

void operand_decoder::decode_bit_enum(
  const operand_kind_info &oki, std::vector<operand> &ops)
{
  const size_t at = cursor.offset();
  const uint32_t val = cursor.next_word();

  // validate every bit before we decode any parameters
  std::vector<const enumerant *> set_bits;
  for (uint32_t b = 0; b < 32; b++) {
    const uint32_t bit = 1u << b;
    if ((val & bit) == 0)
      continue;
    const enumerant *e = find_enumerant(oki, bit);
    if (!e)
      throw decode_error::enumerant_unknown(at, oki.kind, bit);
    set_bits.push_back(e);
  }

  ops.push_back(operand::enum_value(oki.kind, val));
  // parameters follow in order of increasing bit position
  for (const enumerant *e : set_bits)
    for (operand_kind p : e->parameters)
      decode_into(p, ops);
}
