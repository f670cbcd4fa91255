#ifndef SPVBIN_FATAL_HPP
#define SPVBIN_FATAL_HPP

#include "text.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

#define EXIT_INTERNAL_ERROR 2

namespace spvbin
{
  // A location in a binary module: a byte offset, the 1-based index of
  // the instruction it falls in (0 if none), and how many bytes to mark.
  struct loc {
    uint32_t offset, index, extent;
    constexpr loc() : offset(0), index(0), extent(0) {}
    constexpr loc(uint32_t off, uint32_t ix, uint32_t len)
      : offset(off), index(ix), extent(len) { }

    bool has_context() const {return extent > 0;}

    // "0x14" or "0x14 (instruction #2)"
    std::string str() const {
      std::string s = "0x" + text::fmt_hex(offset, 0);
      if (index > 0)
        s += text::format(" (instruction #", index, ")");
      return s;
    }
  }; // loc
  static constexpr loc NO_LOC {0,0,0};

  // emits the message and, for a location with an extent, a hex dump of
  // the surrounding words with the ones at the location highlighted
  void format_message_with_context_impl(
    std::ostream &os,
    const loc &at,
    const text::ansi_literal *highlight,
    const text::ansi_literal *message_color,
    const std::string &path,
    const std::vector<uint8_t> &input,
    const std::string &message);

  template <typename...Ts>
  void format_message_with_context(
    std::ostream &os,
    const loc &at,
    const text::ansi_literal *highlight,
    const text::ansi_literal *message_color,
    const std::string &path,
    const std::vector<uint8_t> &input,
    Ts... ts)
  {
    std::stringstream ss;
    text::format_to(ss, ts...);
    format_message_with_context_impl(
      os, at, highlight, message_color, path, input, ss.str());
  }

  struct diagnostic : std::exception {
    enum error_level {WARNING, ERROR, INTERNAL} level = ERROR;
    loc                    at;
    std::string            message;
    std::string            path;
    std::vector<uint8_t>   input;

    diagnostic(
      enum error_level lvl,
      loc _at,
      const std::string &m,
      const std::string &p,
      const std::vector<uint8_t> &inp)
      : level(lvl)
      , at(_at)
      , message(m)
      , path(p)
      , input(inp)
    { }

    const char   *what() const noexcept override {return message.c_str();}

    // emits the diagnostic to an output stream
    void          str(std::ostream &os) const;
    // returns a new string
    std::string   str() const;

    // emits to std::cerr and exits with EXIT_FAILURE (or
    // EXIT_INTERNAL_ERROR for INTERNAL)
    [[noreturn]]
    void          emit_and_exit_with_error() const;
  }; // diagnostic

  using warning_list = std::vector<diagnostic>;

  // Per-input diagnostic state: the file path and its bytes (for context),
  // the verbosity, and any warnings not flushed yet.
  class diagnostics {
    int                                         m_verbosity;
    std::string                                 m_path;
    const std::vector<uint8_t>                 &m_input;
    warning_list                                m_warnings;
  public:
    diagnostics(
      int verbosity,
      const std::string &path,
      const std::vector<uint8_t> &input)
      : m_verbosity(verbosity), m_path(path), m_input(input)
    { }

    const std::string &path() const {return m_path;}
    const std::vector<uint8_t> &input() const {return m_input;}
    int verbosity() const {return m_verbosity;}

    const warning_list &warnings() const {return m_warnings;}

    void flush_warnings(std::ostream &os) {
      for (const auto &w : m_warnings) {
        w.str(os);
      }
      m_warnings.clear();
    }

    template <typename...Ts>
    [[noreturn]]
    void internal_at(const loc &at, Ts... ts) const {
      throw diagnostic(
        diagnostic::INTERNAL,
        at,
        text::format("INTERNAL ERROR: ", ts...),
        m_path,
        m_input);
    }
    template <typename...Ts>
    [[noreturn]]
    void fatal_at(const loc &at, Ts... ts) const {
      throw diagnostic(
        diagnostic::ERROR, at, text::format(ts...), m_path, m_input);
    }
    template <typename...Ts>
    void warning_at(const loc &at, Ts... ts) {
      m_warnings.emplace_back(
        diagnostic::WARNING, at, text::format(ts...), m_path, m_input);
    }
    template <typename...Ts>
    void verbose_at(const loc &at, Ts... ts) const {
      if (m_verbosity > 0)
        format_message_with_context(
          std::cout, at,
          &text::ANSI_GREEN, &text::ANSI_FADED,
          m_path, m_input, ts...);
    }
    template <typename...Ts>
    void debug_at(const loc &at, Ts... ts) const {
      if (m_verbosity > 1)
        format_message_with_context(
          std::cout, at,
          &text::ANSI_FADED_YELLOW, &text::ANSI_FADED,
          m_path, m_input, ts...);
    }
  }; // diagnostics
} // namespace spvbin

#endif
