// Tests for the push parser: header checks, per-instruction framing,
// operand quantifiers and the consumer protocol.
#include <gtest/gtest.h>

#include "grammar/spirv.hpp"
#include "module_builder.hpp"
#include "parser/parser.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace spvbin;
using S = parse_result::state;
using K = operand_kind;

namespace
{
// records every callback; optionally answers one of them with a non-CONTINUE
struct recorder : consumer {
  enum callback {INITIALIZE, HEADER, INSTRUCTION, FINALIZE};

  std::vector<callback>         calls;
  std::vector<module_header>    headers;
  std::vector<instruction>      insts;

  std::optional<callback>       fail_on;
  size_t                        fail_on_nth_inst = 1;
  action::code                  answer = action::STOP;

  action reply(callback c) {
    calls.push_back(c);
    if (fail_on && *fail_on == c &&
      (c != INSTRUCTION || insts.size() == fail_on_nth_inst))
    {
      if (answer == action::ERROR)
        return action::error("recorder refused");
      return answer;
    }
    return action::CONTINUE;
  }

  action initialize() override {return reply(INITIALIZE);}
  action finalize() override {return reply(FINALIZE);}
  action consume_header(module_header h) override {
    headers.push_back(h);
    return reply(HEADER);
  }
  action consume_instruction(instruction i) override {
    insts.push_back(i);
    return reply(INSTRUCTION);
  }
};

parse_result run(const test::module_builder &mb, recorder &r)
{
  return parse(mb.bytes(), r);
}

// OpCapability Kernel; OpMemoryModel Physical32 OpenCL; %1 = OpTypeInt 32 0
test::module_builder small_module()
{
  test::module_builder mb;
  mb.inst(spv::OpCapability, {6})
    .inst(spv::OpMemoryModel, {1, 2})
    .inst(spv::OpTypeInt, {1, 32, 0});
  return mb;
}
} // namespace

TEST(Parser, HeaderOnly)
{
  recorder r;
  test::module_builder mb(42);
  auto res = run(mb, r);
  EXPECT_TRUE(res.succeeded()) << res.str();
  ASSERT_EQ(r.headers.size(), 1u);
  EXPECT_EQ(r.headers[0].bound, 42u);
  EXPECT_EQ(r.headers[0].major_version(), 1u);
  EXPECT_EQ(r.headers[0].minor_version(), 3u);
  EXPECT_TRUE(r.insts.empty());
  EXPECT_EQ(r.calls, (std::vector<recorder::callback>{
    recorder::INITIALIZE, recorder::HEADER, recorder::FINALIZE}));
}

TEST(Parser, SwappedMagicIsUnsupportedEndianness)
{
  recorder r;
  test::module_builder mb;
  mb.ws[0] = 0x03022307;
  auto res = run(mb, r);
  EXPECT_EQ(res.st, S::ENDIANNESS_UNSUPPORTED);
  EXPECT_TRUE(r.headers.empty());
}

TEST(Parser, BadMagicIsIncorrectHeader)
{
  recorder r;
  test::module_builder mb;
  mb.ws[0] = 0xDEADBEEF;
  auto res = run(mb, r);
  EXPECT_EQ(res.st, S::HEADER_INCORRECT);
  EXPECT_EQ(res.str(), "incorrect module header");
  EXPECT_TRUE(r.headers.empty());
}

TEST(Parser, ShortHeaderIsIncomplete)
{
  recorder r;
  auto bs = test::module_builder().bytes();
  bs.resize(19);
  auto res = parse(bs, r);
  EXPECT_EQ(res.st, S::HEADER_INCOMPLETE);
  ASSERT_TRUE(res.cause.has_value());
  EXPECT_EQ(res.cause->err, decode_error::code::STREAM_EXPECTED);
  EXPECT_TRUE(r.headers.empty());

  recorder r2;
  EXPECT_EQ(parse({}, r2).st, S::HEADER_INCOMPLETE);
}

TEST(Parser, ReservedWordIsNotValidated)
{
  recorder r;
  test::module_builder mb(8, 0x00010000, 0, 0x1234);
  auto res = run(mb, r);
  EXPECT_TRUE(res.succeeded());
  ASSERT_EQ(r.headers.size(), 1u);
  EXPECT_EQ(r.headers[0].reserved, 0x1234u);
}

TEST(Parser, DecodesInstructions)
{
  recorder r;
  auto res = run(small_module(), r);
  ASSERT_TRUE(res.succeeded()) << res.str();
  ASSERT_EQ(r.insts.size(), 3u);

  EXPECT_EQ(r.insts[0].opcode, spv::OpCapability);
  EXPECT_EQ(r.insts[0].str(), "OpCapability Kernel");
  EXPECT_EQ(r.insts[1].str(), "OpMemoryModel Physical32 OpenCL");

  const instruction &ti = r.insts[2];
  EXPECT_FALSE(ti.result_type.has_value());
  ASSERT_TRUE(ti.result_id.has_value());
  EXPECT_EQ(*ti.result_id, 1u);
  ASSERT_EQ(ti.operands.size(), 2u);
  EXPECT_EQ(ti.operands[0], operand::number32(K::LiteralInteger, 32));
  EXPECT_EQ(ti.str(), "%1 = OpTypeInt 32 0");
}

TEST(Parser, ResultTypeAndIdAreNotOperands)
{
  recorder r;
  test::module_builder mb;
  // %3 = OpLoad %1 %2 Aligned 4
  mb.inst(spv::OpLoad, {1, 3, 2, 0x2, 4});
  auto res = run(mb, r);
  ASSERT_TRUE(res.succeeded()) << res.str();
  ASSERT_EQ(r.insts.size(), 1u);
  const instruction &i = r.insts[0];
  EXPECT_EQ(i.result_type, std::optional<uint32_t>(1));
  EXPECT_EQ(i.result_id, std::optional<uint32_t>(3));
  ASSERT_EQ(i.operands.size(), 3u);
  EXPECT_EQ(i.operands[0], operand::id(K::IdRef, 2));
  EXPECT_EQ(i.str(), "%3 = OpLoad %1 %2 Aligned 4");
}

TEST(Parser, StringOperands)
{
  recorder r;
  test::module_builder mb;
  // OpEntryPoint Kernel %4 "main" %5 %6
  mb.inst(spv::OpEntryPoint,
    test::concat(test::concat({6, 4}, test::string_words("main")), {5, 6}));
  auto res = run(mb, r);
  ASSERT_TRUE(res.succeeded()) << res.str();
  ASSERT_EQ(r.insts.size(), 1u);
  const auto &ops = r.insts[0].operands;
  ASSERT_EQ(ops.size(), 5u);
  EXPECT_EQ(ops[2], operand::string(K::LiteralString, "main"));
  EXPECT_EQ(ops[4], operand::id(K::IdRef, 6));
}

TEST(Parser, DecorateStringTakesStringParameter)
{
  recorder r;
  test::module_builder mb;
  // OpDecorateString %5 UserSemantic "foo"
  mb.inst(spv::OpDecorateString,
    test::concat({5, 5635}, test::string_words("foo")));
  auto res = run(mb, r);
  ASSERT_TRUE(res.succeeded()) << res.str();
  ASSERT_EQ(r.insts.size(), 1u);
  const auto &ops = r.insts[0].operands;
  ASSERT_EQ(ops.size(), 3u);
  EXPECT_EQ(ops[1], operand::enum_value(K::Decoration, 5635));
  EXPECT_EQ(ops[2], operand::string(K::LiteralString, "foo"));
  EXPECT_EQ(r.insts[0].str(), "OpDecorateString %5 UserSemantic \"foo\"");
}

TEST(Parser, WordCountZero)
{
  recorder r;
  auto mb = small_module();
  mb.raw({test::first_word(0, spv::OpNop)});
  mb.inst(spv::OpNop);
  auto res = run(mb, r);
  EXPECT_EQ(res.st, S::WORD_COUNT_ZERO);
  EXPECT_EQ(res.index, 4u);
  // header (20) + 2 + 3 + 4 words
  EXPECT_EQ(res.offset, 20u + 9 * 4);
  EXPECT_EQ(r.insts.size(), 3u);
  EXPECT_EQ(r.calls.back(), recorder::INSTRUCTION);
}

TEST(Parser, UnknownOpcode)
{
  recorder r;
  test::module_builder mb;
  mb.inst(spv::OpNop).inst(0x1234, {1, 2});
  auto res = run(mb, r);
  EXPECT_EQ(res.st, S::OPCODE_UNKNOWN);
  EXPECT_EQ(res.opcode, 0x1234);
  EXPECT_EQ(res.index, 2u);
  EXPECT_EQ(res.offset, 24u);
  EXPECT_EQ(res.str(), "unknown opcode (4660) for instruction #2 at offset 24");
}

TEST(Parser, MissingOperandIsOperandExpected)
{
  recorder r;
  test::module_builder mb;
  // OpTypeInt wants %id width signedness
  mb.inst(spv::OpTypeInt, {1, 32});
  auto res = run(mb, r);
  EXPECT_EQ(res.st, S::OPERAND_EXPECTED);
  EXPECT_EQ(res.index, 1u);
  EXPECT_TRUE(r.insts.empty());
}

TEST(Parser, ExtraWordsAreOperandExceeded)
{
  recorder r;
  test::module_builder mb;
  mb.inst(spv::OpTypeInt, {1, 32, 0, 99});
  auto res = run(mb, r);
  EXPECT_EQ(res.st, S::OPERAND_EXCEEDED);
  EXPECT_EQ(res.index, 1u);
  // the cursor stops right before the extra word
  EXPECT_EQ(res.offset, 20u + 4 * 4);
  EXPECT_TRUE(r.insts.empty());
}

TEST(Parser, OptionalOperandMayBeAbsent)
{
  recorder r;
  test::module_builder mb;
  mb.inst(spv::OpStore, {5, 6});
  mb.inst(spv::OpStore, {5, 6, 0x1});
  auto res = run(mb, r);
  ASSERT_TRUE(res.succeeded()) << res.str();
  ASSERT_EQ(r.insts.size(), 2u);
  EXPECT_EQ(r.insts[0].operands.size(), 2u);
  EXPECT_EQ(r.insts[1].operands.size(), 3u);
  EXPECT_EQ(r.insts[1].str(), "OpStore %5 %6 Volatile");
}

TEST(Parser, VariadicOperandsRepeat)
{
  recorder r;
  test::module_builder mb;
  // %9 = OpTypeFunction %1 %2 %3 %4
  mb.inst(spv::OpTypeFunction, {9, 1, 2, 3, 4});
  // OpSwitch %7 %8 1 %10 2 %11
  mb.inst(spv::OpSwitch, {7, 8, 1, 10, 2, 11});
  // %12 = OpTypeFunction %1 (no parameters)
  mb.inst(spv::OpTypeFunction, {12, 1});
  auto res = run(mb, r);
  ASSERT_TRUE(res.succeeded()) << res.str();
  ASSERT_EQ(r.insts.size(), 3u);
  EXPECT_EQ(r.insts[0].operands.size(), 4u);
  EXPECT_EQ(r.insts[0].str(), "%9 = OpTypeFunction %1 %2 %3 %4");

  const auto &sw = r.insts[1].operands;
  ASSERT_EQ(sw.size(), 6u);
  EXPECT_EQ(sw[2], operand::number32(K::LiteralInteger, 1));
  EXPECT_EQ(sw[5], operand::id(K::IdRef, 11));

  EXPECT_EQ(r.insts[2].operands.size(), 1u);
}

TEST(Parser, ContextDependentConstants)
{
  recorder r;
  test::module_builder mb;
  mb.inst(spv::OpConstant, {1, 2, 42});
  mb.inst(spv::OpConstant, {3, 4, 0xFFFFFFFF, 0x7FFFFFFF});
  auto res = run(mb, r);
  ASSERT_TRUE(res.succeeded()) << res.str();
  ASSERT_EQ(r.insts.size(), 2u);
  EXPECT_EQ(r.insts[0].operands[0],
    operand::number32(K::LiteralContextDependentNumber, 42));
  EXPECT_EQ(r.insts[1].operands[0],
    operand::number64(K::LiteralContextDependentNumber, 0x7FFFFFFFFFFFFFFFull));
}

TEST(Parser, OperandErrorWrapsCause)
{
  recorder r;
  test::module_builder mb;
  mb.inst(spv::OpCapability, {0xFFFF});
  auto res = run(mb, r);
  EXPECT_EQ(res.st, S::OPERAND_ERROR);
  ASSERT_TRUE(res.cause.has_value());
  EXPECT_EQ(res.cause->err, decode_error::code::ENUMERANT_UNKNOWN);
  EXPECT_EQ(res.cause->value, 0xFFFFu);
  EXPECT_EQ(res.offset, 24u);
}

TEST(Parser, UnterminatedStringIsOperandError)
{
  recorder r;
  test::module_builder mb;
  // OpName %1 "abcd" with no room for the NUL
  mb.inst(spv::OpName, {1, 0x64636261});
  auto res = run(mb, r);
  EXPECT_EQ(res.st, S::OPERAND_ERROR);
  ASSERT_TRUE(res.cause.has_value());
  EXPECT_EQ(res.cause->err, decode_error::code::LIMIT_REACHED);
}

TEST(Parser, TruncatedInstruction)
{
  recorder r;
  test::module_builder mb;
  mb.inst(spv::OpNop);
  // claims four words but the buffer ends after two
  mb.raw({test::first_word(4, spv::OpTypeInt), 1});
  auto res = run(mb, r);
  EXPECT_EQ(res.st, S::INSTRUCTION_INCOMPLETE);
  EXPECT_EQ(res.index, 2u);
  EXPECT_EQ(res.offset, 24u);
  EXPECT_EQ(r.insts.size(), 1u);
}

TEST(Parser, RaggedTail)
{
  recorder r;
  auto bs = small_module().bytes();
  bs.push_back(0);
  bs.push_back(0);
  auto res = parse(bs, r);
  // fewer than four trailing bytes end the stream
  EXPECT_TRUE(res.succeeded()) << res.str();
  EXPECT_EQ(r.insts.size(), 3u);
  EXPECT_EQ(r.calls.back(), recorder::FINALIZE);

  recorder r2;
  auto one = test::module_builder().inst(spv::OpNop).bytes();
  one.push_back(0);
  one.push_back(0);
  one.push_back(0);
  EXPECT_TRUE(parse(one, r2).succeeded());
  EXPECT_EQ(r2.insts.size(), 1u);
  EXPECT_EQ(r2.calls.back(), recorder::FINALIZE);
}

TEST(Parser, StopFromEachCallback)
{
  const recorder::callback cbs[] {
    recorder::INITIALIZE, recorder::HEADER,
    recorder::INSTRUCTION, recorder::FINALIZE};
  for (auto cb : cbs) {
    recorder r;
    r.fail_on = cb;
    r.fail_on_nth_inst = 2;
    auto res = run(small_module(), r);
    EXPECT_EQ(res.st, S::CONSUMER_STOP_REQUESTED) << (int)cb;
    EXPECT_TRUE(res.stopped());
    ASSERT_FALSE(r.calls.empty());
    // nothing is called after the callback that stopped
    EXPECT_EQ(r.calls.back(), cb);
    if (cb == recorder::INSTRUCTION) {
      EXPECT_EQ(r.insts.size(), 2u);
    }
  }
}

TEST(Parser, ConsumerErrorCarriesCause)
{
  recorder r;
  r.fail_on = recorder::HEADER;
  r.answer = action::ERROR;
  auto res = run(small_module(), r);
  EXPECT_EQ(res.st, S::CONSUMER_ERROR);
  EXPECT_EQ(res.consumer_cause, "recorder refused");
  EXPECT_EQ(res.str(), "consumer error: recorder refused");
  EXPECT_TRUE(r.insts.empty());
  EXPECT_EQ(r.calls.back(), recorder::HEADER);
}

TEST(Parser, ConsumerErrorOnInstructionIsLocated)
{
  recorder r;
  r.fail_on = recorder::INSTRUCTION;
  r.fail_on_nth_inst = 2;
  r.answer = action::ERROR;
  auto res = run(small_module(), r);
  EXPECT_EQ(res.st, S::CONSUMER_ERROR);
  // OpMemoryModel follows the two-word OpCapability
  EXPECT_EQ(res.index, 2u);
  EXPECT_EQ(res.offset, 28u);
  EXPECT_EQ(r.insts.size(), 2u);
}

TEST(Parser, Deterministic)
{
  auto mb = small_module();
  mb.inst(spv::OpTypeFunction, {9, 1, 2, 3});
  recorder a, b;
  auto ra = run(mb, a);
  auto rb = run(mb, b);
  EXPECT_EQ(ra.st, rb.st);
  EXPECT_EQ(a.calls, b.calls);
  EXPECT_EQ(a.headers, b.headers);
  EXPECT_EQ(a.insts, b.insts);
}

TEST(Parser, StateNames)
{
  EXPECT_STREQ(to_syntax(S::COMPLETE), "COMPLETE");
  EXPECT_STREQ(to_syntax(S::OPERAND_EXCEEDED), "OPERAND_EXCEEDED");
  EXPECT_STREQ(parse_result(S::WORD_COUNT_ZERO).description(),
    "zero word count found");
}
