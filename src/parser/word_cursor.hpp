#ifndef SPVBIN_PARSER_WORD_CURSOR_HPP
#define SPVBIN_PARSER_WORD_CURSOR_HPP

#include "decode_error.hpp"

#include <algorithm>
#include <climits>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace spvbin {

  enum class endian {LITTLE, BIG};

  // A forward-only reader of 32b words over a byte buffer.  The buffer
  // is borrowed; the owner must outlive the cursor.
  //
  // The window (set_limit) bounds how many more words may be read; the
  // parser opens one per instruction so the operand decoder can never
  // run into the next instruction.
  class word_cursor {
    const uint8_t          *bits;
    size_t                  bits_length;
    endian                  order;

    size_t                  off = 0;
    std::optional<size_t>   limit;

  public:
    word_cursor(
      const uint8_t *_bits,
      size_t _bits_length,
      endian _order = endian::LITTLE)
      : bits(_bits), bits_length(_bits_length), order(_order) { }
    explicit word_cursor(
      const std::vector<uint8_t> &bs,
      endian _order = endian::LITTLE)
      : word_cursor(bs.data(), bs.size(), _order) { }

    ///////////////////////////////////////////////////////////////////////////
    size_t bytes_left() const {return bits_length - off;}
    bool at_end() const {return off == bits_length;}
    // byte offset of the next word
    size_t offset() const {return off;}
    size_t word_offset() const {return off / sizeof(uint32_t);}
    endian byte_order() const {return order;}

    ///////////////////////////////////////////////////////////////////////////
    // window
    void set_limit(size_t words) {limit = words;}
    void clear_limit() {limit.reset();}
    bool has_limit() const {return limit.has_value();}
    bool limit_reached() const {return limit && *limit == 0;}
    // words readable before either the window or the buffer runs out
    size_t limit_remaining() const {
      size_t in_buffer = bytes_left() / sizeof(uint32_t);
      return limit ? std::min(*limit, in_buffer) : in_buffer;
    }

    ///////////////////////////////////////////////////////////////////////////
    // Read without advance
    uint32_t peek_word() const {
      check_words(1);
      return assemble(off);
    }

    ///////////////////////////////////////////////////////////////////////////
    // Read and advance
    uint32_t next_word() {
      check_words(1);
      uint32_t w = assemble(off);
      advance(1);
      return w;
    }
    uint32_t next_identifier() {return next_word();}

    // all or nothing: on failure the cursor has not moved
    std::vector<uint32_t> next_words(size_t n) {
      check_words(n);
      std::vector<uint32_t> ws;
      ws.reserve(n);
      for (size_t i = 0; i < n; i++)
        ws.push_back(assemble(off + i * sizeof(uint32_t)));
      advance(n);
      return ws;
    }

    // A NUL-terminated UTF-8 string padded to a word boundary.
    // Bytes are in stream order regardless of the word byte order.
    std::string next_string() {
      std::string s;
      while (true) {
        check_words(1);
        const uint8_t *w = bits + off;
        advance(1);
        for (size_t i = 0; i < sizeof(uint32_t); i++) {
          if (w[i] == 0)
            return s;
          s += (char)w[i];
        }
      }
    }

    ///////////////////////////////////////////////////////////////////////////
    template <typename T>
    static T swap_byte_order(T t) {
      static_assert (CHAR_BIT == 8, "CHAR_BIT != 8");

      union { T u; uint8_t u8[sizeof(T)]; } src, dst;
      src.u = t;
      for (size_t k = 0; k < sizeof(T); k++)
        dst.u8[k] = src.u8[sizeof(T) - k - 1];
      return dst.u;
    }

  private:
    void check_words(size_t n) const {
      if (limit && *limit < n)
        throw decode_error::limit_reached(off);
      if (bytes_left() < n * sizeof(uint32_t))
        throw decode_error::stream_expected(off);
    }
    void advance(size_t n) {
      off += n * sizeof(uint32_t);
      if (limit)
        *limit -= n;
    }
    uint32_t assemble(size_t at) const {
      const uint8_t *b = bits + at;
      if (order == endian::LITTLE)
        return (uint32_t)b[0] | ((uint32_t)b[1] << 8) |
          ((uint32_t)b[2] << 16) | ((uint32_t)b[3] << 24);
      return (uint32_t)b[3] | ((uint32_t)b[2] << 8) |
        ((uint32_t)b[1] << 16) | ((uint32_t)b[0] << 24);
    }
  }; // class word_cursor
}

#endif
