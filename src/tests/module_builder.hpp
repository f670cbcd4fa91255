// Helpers that assemble small modules word by word for the parser tests.
#ifndef SPVBIN_TESTS_MODULE_BUILDER_HPP
#define SPVBIN_TESTS_MODULE_BUILDER_HPP

#include "grammar/spirv.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace spvbin::test
{
  using words = std::vector<uint32_t>;

  inline uint32_t first_word(uint16_t wc, uint16_t opcode) {
    return ((uint32_t)wc << 16) | opcode;
  }

  // a NUL-terminated string packed into words (little-endian), zero padded
  inline words string_words(const std::string &s) {
    words ws((s.size() + 1 + 3) / 4, 0);
    for (size_t i = 0; i < s.size(); i++)
      ws[i / 4] |= (uint32_t)(uint8_t)s[i] << (8 * (i % 4));
    return ws;
  }

  struct module_builder {
    words ws;

    explicit module_builder(
      uint32_t bound = 16,
      uint32_t version = 0x00010300,
      uint32_t generator = 0x00080001,
      uint32_t reserved = 0)
    {
      ws = {spv::MAGIC_NUMBER, version, generator, bound, reserved};
    }

    // appends an instruction with its word count computed
    module_builder &inst(uint16_t opcode, std::initializer_list<uint32_t> ops = {}) {
      return inst(opcode, words(ops));
    }
    module_builder &inst(uint16_t opcode, const words &ops) {
      ws.push_back(first_word((uint16_t)(ops.size() + 1), opcode));
      ws.insert(ws.end(), ops.begin(), ops.end());
      return *this;
    }
    // appends raw words (e.g. a malformed first word)
    module_builder &raw(std::initializer_list<uint32_t> rs) {
      ws.insert(ws.end(), rs.begin(), rs.end());
      return *this;
    }

    std::vector<uint8_t> bytes() const {
      std::vector<uint8_t> bs;
      for (uint32_t w : ws) {
        bs.push_back((uint8_t)(w & 0xFF));
        bs.push_back((uint8_t)((w >> 8) & 0xFF));
        bs.push_back((uint8_t)((w >> 16) & 0xFF));
        bs.push_back((uint8_t)((w >> 24) & 0xFF));
      }
      return bs;
    }
  }; // module_builder

  inline words concat(words a, const words &b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
  }
} // namespace spvbin::test

#endif
