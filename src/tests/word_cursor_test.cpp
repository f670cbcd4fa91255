// Tests for the word cursor: byte order, the per-instruction window, and
// all-or-nothing reads.
#include <gtest/gtest.h>

#include "parser/word_cursor.hpp"

#include <cstdint>
#include <vector>

using namespace spvbin;

namespace
{
std::vector<uint8_t> four_words()
{
  return {
    0x01, 0x02, 0x03, 0x04,
    0x05, 0x06, 0x07, 0x08,
    0x09, 0x0A, 0x0B, 0x0C,
    0x0D, 0x0E, 0x0F, 0x10,
  };
}
} // namespace

TEST(WordCursor, LittleEndianWords)
{
  auto bs = four_words();
  word_cursor c(bs);
  EXPECT_EQ(c.next_word(), 0x04030201u);
  EXPECT_EQ(c.offset(), 4u);
  EXPECT_EQ(c.next_word(), 0x08070605u);
  EXPECT_EQ(c.word_offset(), 2u);
  EXPECT_EQ(c.bytes_left(), 8u);
}

TEST(WordCursor, BigEndianWords)
{
  auto bs = four_words();
  word_cursor c(bs, endian::BIG);
  EXPECT_EQ(c.byte_order(), endian::BIG);
  EXPECT_EQ(c.next_word(), 0x01020304u);
  EXPECT_EQ(c.next_word(), 0x05060708u);
}

TEST(WordCursor, PeekDoesNotAdvance)
{
  auto bs = four_words();
  word_cursor c(bs);
  EXPECT_EQ(c.peek_word(), 0x04030201u);
  EXPECT_EQ(c.offset(), 0u);
  EXPECT_EQ(c.next_word(), 0x04030201u);
}

TEST(WordCursor, ShortTailIsStreamExpected)
{
  std::vector<uint8_t> bs {0x01, 0x02, 0x03, 0x04, 0xAA, 0xBB};
  word_cursor c(bs);
  c.next_word();
  try {
    c.next_word();
    FAIL() << "expected decode_error";
  } catch (const decode_error &e) {
    EXPECT_EQ(e.err, decode_error::code::STREAM_EXPECTED);
    EXPECT_EQ(e.offset, 4u);
  }
  EXPECT_EQ(c.offset(), 4u);
  EXPECT_FALSE(c.at_end());
}

TEST(WordCursor, NextWordsIsAllOrNothing)
{
  auto bs = four_words();
  word_cursor c(bs);
  c.next_word();
  EXPECT_THROW(c.next_words(4), decode_error);
  EXPECT_EQ(c.offset(), 4u);
  auto ws = c.next_words(3);
  ASSERT_EQ(ws.size(), 3u);
  EXPECT_EQ(ws[2], 0x100F0E0Du);
  EXPECT_TRUE(c.at_end());
}

TEST(WordCursor, LimitBoundsReads)
{
  auto bs = four_words();
  word_cursor c(bs);
  c.set_limit(2);
  EXPECT_TRUE(c.has_limit());
  EXPECT_EQ(c.limit_remaining(), 2u);
  c.next_word();
  EXPECT_FALSE(c.limit_reached());
  c.next_word();
  EXPECT_TRUE(c.limit_reached());
  try {
    c.next_word();
    FAIL() << "expected decode_error";
  } catch (const decode_error &e) {
    EXPECT_EQ(e.err, decode_error::code::LIMIT_REACHED);
    EXPECT_EQ(e.offset, 8u);
  }
  c.clear_limit();
  EXPECT_FALSE(c.has_limit());
  EXPECT_FALSE(c.limit_reached());
  EXPECT_EQ(c.next_word(), 0x0C0B0A09u);
}

TEST(WordCursor, LimitRemainingIsBoundedByBuffer)
{
  auto bs = four_words();
  word_cursor c(bs);
  EXPECT_EQ(c.limit_remaining(), 4u);
  c.set_limit(10);
  EXPECT_EQ(c.limit_remaining(), 4u);
}

TEST(WordCursor, LimitCheckedBeforeBuffer)
{
  std::vector<uint8_t> bs {0x01, 0x02, 0x03, 0x04};
  word_cursor c(bs);
  c.set_limit(1);
  try {
    c.next_words(2);
    FAIL() << "expected decode_error";
  } catch (const decode_error &e) {
    EXPECT_EQ(e.err, decode_error::code::LIMIT_REACHED);
  }
}

TEST(WordCursor, StringsStopAtNul)
{
  // "abcde" + NUL + padding, then one more word
  std::vector<uint8_t> bs {
    'a', 'b', 'c', 'd',
    'e', 0, 0, 0,
    0x2A, 0, 0, 0,
  };
  word_cursor c(bs);
  EXPECT_EQ(c.next_string(), "abcde");
  EXPECT_EQ(c.offset(), 8u);
  EXPECT_EQ(c.next_word(), 42u);
}

TEST(WordCursor, EmptyStringTakesOneWord)
{
  std::vector<uint8_t> bs {0, 0, 0, 0, 7, 0, 0, 0};
  word_cursor c(bs);
  EXPECT_EQ(c.next_string(), "");
  EXPECT_EQ(c.offset(), 4u);
}

TEST(WordCursor, StringsIgnoreWordByteOrder)
{
  std::vector<uint8_t> bs {'m', 'a', 'i', 'n', 0, 0, 0, 0};
  word_cursor c(bs, endian::BIG);
  EXPECT_EQ(c.next_string(), "main");
}

TEST(WordCursor, UnterminatedStringHitsLimit)
{
  std::vector<uint8_t> bs {'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h'};
  word_cursor c(bs);
  c.set_limit(1);
  try {
    c.next_string();
    FAIL() << "expected decode_error";
  } catch (const decode_error &e) {
    EXPECT_EQ(e.err, decode_error::code::LIMIT_REACHED);
  }
}

TEST(WordCursor, SwapByteOrder)
{
  EXPECT_EQ(word_cursor::swap_byte_order<uint32_t>(0x07230203u), 0x03022307u);
  EXPECT_EQ(word_cursor::swap_byte_order<uint16_t>(0x1234), 0x3412);
}
