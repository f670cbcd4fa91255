#include "system.hpp"
#include "text.hpp"

#ifdef _WIN32
#include <Windows.h>
#endif
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <iomanip>
#include <sstream>

bool text::is_tty(std::ostream &os)
{
  return sys::is_tty(os);
}

#ifdef _WIN32
static void enable_colored_io()
{
  static bool enabled = false;
  if (enabled)
    return;
#ifndef ENABLE_VIRTUAL_TERMINAL_PROCESSING
#define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
#endif
  auto enable_on_handle = [](DWORD H_CODE) {
    DWORD mode;
    HANDLE h = GetStdHandle(H_CODE);
    GetConsoleMode(h, &mode);
    mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    SetConsoleMode(h, mode);
  };
  enable_on_handle(STD_ERROR_HANDLE);
  enable_on_handle(STD_OUTPUT_HANDLE);
  enabled = true;
}

// create a static constructor
struct dummy
{
  dummy() {
    enable_colored_io();
  };
};
static dummy _dummy;
#endif

void text::printf_to(std::ostream &os, const char *patt, va_list va)
{
  va_list va_tmp;
  va_copy(va_tmp, va);
  int elen = vsnprintf(nullptr, 0, patt, va_tmp);
  va_end(va_tmp);
  if (elen < 0)
    return;

  std::string ebuf((size_t)elen + 1, '\0');
  vsnprintf(&ebuf[0], ebuf.size(), patt, va);
  ebuf.resize((size_t)elen);

  os << ebuf;
}
void text::printf_to(std::ostream &os, const char *patt, ...)
{
  va_list va;
  va_start(va, patt);
  text::printf_to(os, patt, va);
  va_end(va);
}

/////////////////////////////////////////////////////////////////////////////
void text::expand_bitset_to(
  std::ostream &os,
  uint64_t val,
  const bitset_mappings &mappings)
{
  // check for a zero symbol or a compound match
  for (const auto &[v,sym] : mappings) {
    if (val == v) {
      os << sym;
      return;
    }
  }
  // no match and no mapping for 0x0 => emit 0x0
  if (val == 0) {
    os << "0x0";
    return;
  }
  // loop through bits
  bool first = true;
  auto add_sep = [&]() {
    if (first) {
      first = false;
    } else {
      os << '|';
    }
  };
  for (const auto &[v,sym] : mappings) {
    if (v != 0 && (val & v) == v) {
      add_sep();
      os << sym;
      val &= ~v;
    }
  }
  if (val != 0) {
    add_sep();
    os << "0x" << text::hex(val, 0);
  }
}

/////////////////////////////////////////////////////////////////////////////
void text::table::col::emit(double f, int prec) {
  std::stringstream ss;
  ss << std::fixed << std::setprecision(prec) << f;
  rows.push_back(ss.str());
  max_width = std::max<size_t>(max_width, rows.back().size());
}

void text::table::str(std::ostream &os, const char *delim) const {
  os << std::setfill(' ');
  size_t max_rows = 0;
  for (const auto *c : cols) {
    max_rows = std::max<size_t>(max_rows, c->rows.size());
  }
  for (size_t i = 0; i < max_rows; i++) {
    for (size_t ci = 0; ci < cols.size(); ci++) {
      const col *c = cols[ci];
      if (ci > 0)
        os << delim;
      auto align = c->numeric ? std::right : std::left;
      const std::string val = i < c->rows.size() ? c->rows[i] : "";
      os << align << std::setw(c->max_width) << val;
    }
    os << '\n';
  }
}

std::ostream &text::operator <<(std::ostream &os, text::hex h) {
  std::stringstream ss;
  ss << std::setw(h.columns) <<
    std::setfill('0') << std::hex << std::uppercase << h.value;
  os << ss.str();
  return os;
}
std::ostream &text::operator <<(std::ostream &os, const text::ansi_literal &e)
{
  if (e.esc && sys::is_tty(os))
    os << e.esc;
  return os;
}
