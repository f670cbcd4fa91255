// Consistency checks over the built-in instruction and operand tables.
#include <gtest/gtest.h>

#include "grammar/grammar_table.hpp"
#include "grammar/spirv.hpp"

#include <set>
#include <string>

using namespace spvbin;
using K = operand_kind;

TEST(GrammarTable, LookupKnownOpcodes)
{
  const instruction_grammar *g = lookup_opcode(spv::OpTypeInt);
  ASSERT_NE(g, nullptr);
  EXPECT_STREQ(g->opname, "OpTypeInt");
  EXPECT_EQ(g->opcode, spv::OpTypeInt);
  EXPECT_TRUE(g->has_result());
  EXPECT_FALSE(g->has_result_type());

  g = lookup_opcode(spv::OpLoad);
  ASSERT_NE(g, nullptr);
  EXPECT_TRUE(g->has_result_type());
  EXPECT_EQ(g->operands.back().quant, quantifier::ZERO_OR_ONE);
}

TEST(GrammarTable, UnknownOpcode)
{
  EXPECT_EQ(lookup_opcode(0x1234), nullptr);
  EXPECT_EQ(lookup_opcode(9), nullptr); // unassigned
  EXPECT_STREQ(opcode_name(0x1234), "Op???");
  EXPECT_STREQ(opcode_name(spv::OpNop), "OpNop");
}

TEST(GrammarTable, OpcodesAndNamesAreUnique)
{
  std::set<uint16_t> ops;
  std::set<std::string> names;
  for (const auto &g : all_instructions()) {
    EXPECT_TRUE(ops.insert(g.opcode).second) << g.opname;
    EXPECT_TRUE(names.insert(g.opname).second) << g.opname;
    EXPECT_EQ(lookup_opcode(g.opcode), &g) << g.opname;
  }
  EXPECT_GT(ops.size(), 200u);
}

TEST(GrammarTable, ResultOperandsComeFirst)
{
  for (const auto &g : all_instructions()) {
    for (size_t i = 0; i < g.operands.size(); i++) {
      const auto &lo = g.operands[i];
      if (lo.kind == K::IdResultType) {
        EXPECT_EQ(i, 0u) << g.opname;
      } else if (lo.kind == K::IdResult) {
        EXPECT_EQ(i, g.has_result_type() ? 1u : 0u) << g.opname;
      }
    }
  }
}

TEST(GrammarTable, VariadicOperandsAreLast)
{
  for (const auto &g : all_instructions()) {
    for (size_t i = 0; i + 1 < g.operands.size(); i++) {
      EXPECT_NE(g.operands[i].quant, quantifier::ZERO_OR_MORE) << g.opname;
    }
  }
}

TEST(GrammarTable, EveryOperandKindIsDescribed)
{
  for (const auto &g : all_instructions()) {
    for (const auto &lo : g.operands) {
      const operand_kind_info &oki = lookup_operand_kind(lo.kind);
      EXPECT_EQ(oki.kind, lo.kind) << g.opname;
    }
  }
}

TEST(OperandKinds, EnumerantLookup)
{
  const operand_kind_info &cap = lookup_operand_kind(K::Capability);
  EXPECT_TRUE(cap.is_enum());
  const enumerant *e = find_enumerant(cap, 6);
  ASSERT_NE(e, nullptr);
  EXPECT_STREQ(e->symbol, "Kernel");
  EXPECT_EQ(find_enumerant(cap, 0xFFFF), nullptr);
  EXPECT_STREQ(operand_kind_name(K::Capability), "Capability");
}

TEST(OperandKinds, FormatEnumerant)
{
  const operand_kind_info &fc = lookup_operand_kind(K::FunctionControl);
  EXPECT_EQ(format_enumerant(fc, 0), "None");
  EXPECT_EQ(format_enumerant(fc, 0x3), "Inline|DontInline");
  const operand_kind_info &sc = lookup_operand_kind(K::StorageClass);
  EXPECT_EQ(format_enumerant(sc, 0x7777), "0x7777");
}

TEST(OperandKinds, SingleBitEnumerants)
{
  for (const auto &oki : all_operand_kinds()) {
    if (oki.category != operand_category::BIT_ENUM)
      continue;
    for (const auto &e : oki.enumerants) {
      EXPECT_EQ(e.value & (e.value - 1), 0u) << oki.name << "." << e.symbol;
    }
  }
}
