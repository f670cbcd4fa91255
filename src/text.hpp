#ifndef SPVBIN_TEXT_HPP
#define SPVBIN_TEXT_HPP

#include <algorithm>
#include <cstdarg>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace text
{
  ///////////////////////////////////////////////////////
  // EXAMPLES:
  //   auto s = format("bound=", bound, "; magic=0x", hex(magic));
  //   std::cout << coll("words:", 16) << colr(n, 8) << "\n";

  // hex stream decorator (zero filled to columns)
  struct hex
  {
    uint64_t value;
    int columns;
    template <typename T>
    explicit hex(T v, int cls = 2 * sizeof(T)) : value((uint64_t)v), columns(cls) { }
  };

  enum class pad {L, R};

  // a value padded out to a column width
  template <typename T>
  struct col
  {
    const pad pd;
    const T &value;
    size_t width;
    char pad_fill;
    explicit col(const T &val, pad p, size_t wid, char f = ' ')
      : pd(p), value(val), width(wid), pad_fill(f) { }
  }; // col
  template <typename T>
  struct coll : col<T>
  {
    explicit coll(const T &val, size_t wid, char f = ' ')
      : col<T>(val, pad::L, wid, f) { }
  };
  template <typename T>
  struct colr : col<T>
  {
    explicit colr(const T &val, size_t wid, char f = ' ')
      : col<T>(val, pad::R, wid, f) { }
  };

  template <typename T>
  static std::string fmt_hex(T val, int w = 2 * sizeof(T)) {
    std::stringstream ss;
    ss << std::uppercase << std::hex << std::setfill('0') << std::setw(w) <<
      val;
    return ss.str();
  }

  /////////////////////////////////////////////////////////////////////////////
  // COLORED TEXT
  //   std::cout << ANSI_RED << "red" << ANSI_RESET << " text.";
  //
  // Escapes are dropped when the stream is not a terminal.
  struct ansi_literal {
    const char *esc;
    constexpr ansi_literal(const char *_esc) : esc(_esc) { }
  };

  constexpr ansi_literal ANSI_RESET("\033[0m");

  constexpr ansi_literal ANSI_RED("\033[1;31m");
  constexpr ansi_literal ANSI_GREEN("\033[1;32m");
  constexpr ansi_literal ANSI_YELLOW("\033[1;33m");
  constexpr ansi_literal ANSI_WHITE("\033[1;37m");

  constexpr ansi_literal ANSI_FADED("\033[38;2;120;120;120m");
  constexpr ansi_literal ANSI_FADED_YELLOW("\033[38;2;120;120;0m");

  // redirects to sys::is_tty, but we don't want to expose the header here
  bool is_tty(std::ostream &os);

  namespace spans {
    // colors one element and resets after it
    //   os << RED(path) << ": file not found\n";
    template<typename T>
    struct ansi_span {
      const char   *esc;
      T             element;
      ansi_span(const char *_esc, const T &_element)
        : esc(_esc), element(_element) { }
    };

    template<typename T>
    ansi_span<T> RED(T t) {return ansi_span<T>(ANSI_RED.esc, t);}

    template<typename T>
    std::ostream &operator <<(std::ostream &os, const ansi_span<T> &e) {
      if (e.esc && text::is_tty(os)) {
        os << e.esc << e.element << ANSI_RESET.esc;
      } else {
        os << e.element;
      }
      return os;
    }
  } // namespace text::spans

  /////////////////////////////////////////////////////////////////////////////
  // TEXT MANIPULATION
  void          printf_to(std::ostream &os, const char *patt, va_list va);
  void          printf_to(std::ostream &os, const char *patt, ...);

  template <typename...Ts>
  void          format_to(std::ostream &) { }
  template <typename T, typename...Ts>
  void          format_to(std::ostream &os, T t, Ts...ts) {
      os << t; format_to(os, ts...);
  }

  template <typename...Ts>
  std::string   format(Ts...ts) {
    std::stringstream ss; format_to(ss, ts...); return ss.str();
  }

  /////////////////////////////////////////////////////////////////////////////
  // BITSET EXPANSION
  // - renders a bitset as a | separated list of symbols
  // - an exact match wins (so 0x0 can map to "None")
  // - otherwise each mapped bit in table order, then leftovers in hex:
  //   e.g. Inline|0x100
  using bitset_mappings = std::vector<std::pair<uint64_t, const char *>>;
  void expand_bitset_to(
      std::ostream                &os,
      uint64_t                     bs,
      const bitset_mappings       &mappings);

  /////////////////////////////////////////////////////////////////////////////
  // TEXT TABLES
  //
  // EXAMPLE:
  //  table t;
  //  auto &c0 = t.define_col("opcode", false);
  //  auto &c1 = t.define_col("avg");
  //  c0.emit("OpLoad");
  //  c1.emit(2.5, 2); // 2.50
  //  t.str(std::cout);
  struct table {
    struct col {
      std::string label;
      bool numeric = true;
      std::vector<std::string> rows;
      size_t max_width = 0;

      col(const std::string &lab, bool num) : label(lab), numeric(num) {
        emit(lab);
      }
      col(const col &) = delete;
      col operator=(const col &) = delete;

      template <typename T>
      void emit(const T &t) {
        std::stringstream ss;
        ss << t;
        rows.push_back(ss.str());
        max_width = std::max<size_t>(max_width, rows.back().size());
      }
      void emit(double f, int prec);
    }; // col
    std::vector<col*> cols; // has to be ptr because we return refs

    table() { }
    ~table() {for (auto *c : cols) {delete c;}}

    col &define_col(const std::string &label, bool numeric = true) {
      cols.push_back(new col(label, numeric));
      return *cols.back();
    }

    void str(std::ostream &os, const char *delim = "  ") const;
  private:
    table(const table &) = delete;
    table &operator=(const table &t) = delete;
  }; // table

  // in namespace text so that format_to finds them by ADL
  std::ostream &operator <<(std::ostream &os, hex h);
  std::ostream &operator <<(std::ostream &os, const ansi_literal &e);

  template <typename T>
  static inline std::ostream &operator<< (std::ostream &os, const col<T> &p) {
    auto s = format(p.value);
    std::stringstream ss;
    if (p.pd == pad::R) {
      for (size_t i = s.size(); i < p.width; i++)
        ss << p.pad_fill;
    }
    ss << s;
    if (p.pd == pad::L) {
      for (size_t i = s.size(); i < p.width; i++)
        ss << p.pad_fill;
    }
    os << ss.str();
    return os;
  }
} // namespace text

#endif
