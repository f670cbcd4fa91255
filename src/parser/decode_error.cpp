#include "decode_error.hpp"
#include "../text.hpp"

using namespace spvbin;

const char *spvbin::to_syntax(decode_error::code c)
{
  switch (c) {
  case decode_error::code::STREAM_EXPECTED:           return "STREAM_EXPECTED";
  case decode_error::code::LIMIT_REACHED:             return "LIMIT_REACHED";
  case decode_error::code::ENUMERANT_UNKNOWN:         return "ENUMERANT_UNKNOWN";
  case decode_error::code::LITERAL_WIDTH_UNSUPPORTED: return "LITERAL_WIDTH_UNSUPPORTED";
  default: return "???";
  }
}

static std::string make_message(
  decode_error::code c,
  size_t off,
  std::optional<operand_kind> k,
  uint32_t val)
{
  switch (c) {
  case decode_error::code::STREAM_EXPECTED:
    return text::format("expected more bytes in the stream at offset ", off);
  case decode_error::code::LIMIT_REACHED:
    return text::format("reached word limit at offset ", off);
  case decode_error::code::ENUMERANT_UNKNOWN:
    return text::format(
      "unknown value 0x", text::hex(val, 0), " for operand kind ",
      k ? operand_kind_name(*k) : "?", " at offset ", off);
  case decode_error::code::LITERAL_WIDTH_UNSUPPORTED:
    return text::format(
      "unsupported literal width (", val, " words) for operand kind ",
      k ? operand_kind_name(*k) : "?", " at offset ", off);
  default:
    return text::format("decode error at offset ", off);
  }
}

decode_error::decode_error(
  code c,
  size_t off,
  std::optional<operand_kind> k,
  uint32_t val)
  : err(c), offset(off), kind(k), value(val)
  , message(make_message(c, off, k, val))
{
}
