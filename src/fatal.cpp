#include "fatal.hpp"
#include "system.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>

using namespace spvbin;

std::string diagnostic::str() const
{
  std::stringstream ss;
  str(ss);
  return ss.str();
}

void spvbin::format_message_with_context_impl(
  std::ostream &os,
  const loc &at,
  const text::ansi_literal *highlight,
  const text::ansi_literal *message_color,
  const std::string &path,
  const std::vector<uint8_t> &input,
  const std::string &message)
{
  if (message_color)
    os << *message_color;

  if (!path.empty())
    os << path << ": ";
  if (at.has_context())
    os << at.str() << ": ";
  os << message << "\n";

  if (at.has_context() && at.offset < input.size()) {
    // two words of leading and trailing context
    const size_t first = at.offset & ~(size_t)3;
    const size_t start = first >= 8 ? first - 8 : 0;
    const size_t end =
      std::min(input.size(), (size_t)at.offset + at.extent + 8);

    os << "  " << text::fmt_hex(start, 5) << ":";
    for (size_t p = start; p < end; p += 4) {
      const bool hot =
        p + 4 > at.offset && p < (size_t)at.offset + at.extent;
      os << ' ';
      if (hot && highlight)
        os << *highlight;
      if (p + 4 <= input.size()) {
        uint32_t w = (uint32_t)input[p] | ((uint32_t)input[p + 1] << 8) |
          ((uint32_t)input[p + 2] << 16) | ((uint32_t)input[p + 3] << 24);
        os << text::fmt_hex(w, 8);
      } else {
        // ragged tail
        for (size_t b = p; b < input.size(); b++)
          os << text::fmt_hex((unsigned)input[b], 2);
      }
      if (hot && highlight)
        os << (message_color ? *message_color : text::ANSI_RESET);
    }
    os << "\n";
  }
  os << text::ANSI_RESET;
}

void diagnostic::str(std::ostream &os) const {
  format_message_with_context_impl(
    os,
    at,
    level == WARNING ? &text::ANSI_YELLOW : &text::ANSI_RED,
    nullptr,
    path,
    input,
    message);
}

void diagnostic::emit_and_exit_with_error() const {
  str(std::cerr);
  if (level == INTERNAL) {
    exit(EXIT_INTERNAL_ERROR);
  } else {
    exit(EXIT_FAILURE);
  }
}
