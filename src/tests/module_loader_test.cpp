// Tests for sorting a decoded stream into the logical module layout.
#include <gtest/gtest.h>

#include "fatal.hpp"
#include "grammar/spirv.hpp"
#include "module_builder.hpp"
#include "parser/module_loader.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace spvbin;
using S = parse_result::state;

namespace
{
// a kernel with one function of two blocks
test::module_builder kernel_module(uint32_t reserved = 0)
{
  test::module_builder mb(20, 0x00010000, 0x00080001, reserved);
  mb.inst(spv::OpCapability, {4})                             // Addresses
    .inst(spv::OpCapability, {6})                             // Kernel
    .inst(spv::OpExtInstImport,
      test::concat({1}, test::string_words("OpenCL.std")))
    .inst(spv::OpMemoryModel, {1, 2})
    .inst(spv::OpEntryPoint,
      test::concat({6, 5}, test::string_words("k")))
    .inst(spv::OpExecutionMode, {5, 17, 1, 1, 1})             // LocalSize
    .inst(spv::OpName, test::concat({5}, test::string_words("k")))
    .inst(spv::OpDecorate, {7, 6, 16})                        // ArrayStride
    .inst(spv::OpTypeVoid, {2})
    .inst(spv::OpTypeFunction, {3, 2})
    .inst(spv::OpTypeInt, {4, 32, 0})
    .inst(spv::OpConstant, {4, 6, 7})
    .inst(spv::OpFunction, {2, 5, 0, 3})
    .inst(spv::OpLabel, {8})
    .inst(spv::OpBranch, {9})
    .inst(spv::OpLabel, {9})
    .inst(spv::OpReturn)
    .inst(spv::OpFunctionEnd);
  return mb;
}
} // namespace

TEST(ModuleLoader, SortsSections)
{
  module m;
  auto res = load_words(kernel_module().ws, m);
  ASSERT_TRUE(res.succeeded()) << res.str();

  ASSERT_TRUE(m.header.has_value());
  EXPECT_EQ(m.header->bound, 20u);
  EXPECT_EQ(m.instructions.size(), 18u);
  EXPECT_EQ(m.capabilities.size(), 2u);
  ASSERT_EQ(m.ext_inst_imports.size(), 1u);
  EXPECT_EQ(m.ext_inst_imports[0].str(), "%1 = OpExtInstImport \"OpenCL.std\"");
  ASSERT_TRUE(m.memory_model.has_value());
  EXPECT_EQ(m.entry_points.size(), 1u);
  EXPECT_EQ(m.execution_modes.size(), 1u);
  EXPECT_EQ(m.debugs.size(), 1u);
  EXPECT_EQ(m.annotations.size(), 1u);
  EXPECT_EQ(m.types_global_values.size(), 4u);
}

TEST(ModuleLoader, GroupsFunctionsIntoBlocks)
{
  module m;
  auto res = load_words(kernel_module().ws, m);
  ASSERT_TRUE(res.succeeded()) << res.str();

  ASSERT_EQ(m.functions.size(), 1u);
  const function &f = m.functions[0];
  ASSERT_TRUE(f.def.has_value());
  EXPECT_EQ(f.id(), std::optional<uint32_t>(5));
  ASSERT_TRUE(f.end.has_value());
  ASSERT_EQ(f.blocks.size(), 2u);
  EXPECT_EQ(f.blocks[0].label->result_id, std::optional<uint32_t>(8));
  ASSERT_EQ(f.blocks[0].body.size(), 1u);
  EXPECT_EQ(f.blocks[0].body[0].opcode, spv::OpBranch);
  ASSERT_EQ(f.blocks[1].body.size(), 1u);
  EXPECT_EQ(f.blocks[1].body[0].opcode, spv::OpReturn);
}

TEST(ModuleLoader, ListingIsGroupedBySection)
{
  module m;
  ASSERT_TRUE(load_words(kernel_module().ws, m).succeeded());
  const std::string s = m.str();
  EXPECT_NE(s.find("OpCapability Kernel"), std::string::npos);
  EXPECT_NE(s.find("%4 = OpTypeInt 32 0"), std::string::npos);
  EXPECT_NE(s.find("OpDecorate %7 ArrayStride 16"), std::string::npos);
  EXPECT_LT(s.find("OpMemoryModel"), s.find("OpFunction "));
}

TEST(ModuleLoader, InstructionOutsideFunction)
{
  module m;
  test::module_builder mb;
  mb.inst(spv::OpReturn);
  auto res = load_words(mb.ws, m);
  EXPECT_EQ(res.st, S::CONSUMER_ERROR);
  EXPECT_NE(res.consumer_cause.find("not inside function"), std::string::npos);
}

TEST(ModuleLoader, NestedFunction)
{
  module m;
  test::module_builder mb;
  mb.inst(spv::OpFunction, {2, 5, 0, 3})
    .inst(spv::OpFunction, {2, 6, 0, 3});
  auto res = load_words(mb.ws, m);
  EXPECT_EQ(res.st, S::CONSUMER_ERROR);
  EXPECT_EQ(res.consumer_cause, "found nested function");
}

TEST(ModuleLoader, UnclosedBlock)
{
  module m;
  test::module_builder mb;
  mb.inst(spv::OpFunction, {2, 5, 0, 3})
    .inst(spv::OpLabel, {8})
    .inst(spv::OpFunctionEnd);
  auto res = load_words(mb.ws, m);
  EXPECT_EQ(res.st, S::CONSUMER_ERROR);
  EXPECT_EQ(res.consumer_cause, "found unclosed basic block");
}

TEST(ModuleLoader, UnclosedFunctionAtEnd)
{
  module m;
  test::module_builder mb;
  mb.inst(spv::OpFunction, {2, 5, 0, 3});
  auto res = load_words(mb.ws, m);
  EXPECT_EQ(res.st, S::CONSUMER_ERROR);
  EXPECT_EQ(res.consumer_cause, "found unclosed function");
}

TEST(ModuleLoader, MultipleMemoryModels)
{
  module m;
  test::module_builder mb;
  mb.inst(spv::OpMemoryModel, {1, 2}).inst(spv::OpMemoryModel, {1, 2});
  auto res = load_words(mb.ws, m);
  EXPECT_EQ(res.st, S::CONSUMER_ERROR);
  EXPECT_EQ(res.consumer_cause, "detected multiple memory models");
}

TEST(ModuleLoader, ReloadStartsFresh)
{
  module m;
  ASSERT_TRUE(load_words(kernel_module().ws, m).succeeded());
  test::module_builder empty;
  ASSERT_TRUE(load_words(empty.ws, m).succeeded());
  EXPECT_TRUE(m.instructions.empty());
  EXPECT_TRUE(m.functions.empty());
}

TEST(ModuleLoader, InstructionLimitStops)
{
  module m;
  module_loader l(m, 3);
  auto res = parse(kernel_module().bytes(), l);
  EXPECT_TRUE(res.stopped());
  EXPECT_EQ(l.instructions_loaded(), 3u);
  EXPECT_EQ(m.capabilities.size(), 2u);
}

TEST(ModuleLoader, InstructionLimitEqualToModuleCompletes)
{
  const auto bs = kernel_module().bytes();
  {
    diagnostics ds(0, "k.spv", bs);
    bool limited = true;
    module m = load_module(ds, 18, &limited);
    EXPECT_FALSE(limited);
    EXPECT_EQ(m.instructions.size(), 18u);
    EXPECT_EQ(m.functions.size(), 1u);
  }
  {
    diagnostics ds(0, "k.spv", bs);
    bool limited = false;
    module m = load_module(ds, 17, &limited);
    EXPECT_TRUE(limited);
    EXPECT_EQ(m.instructions.size(), 17u);
  }
}

TEST(ModuleLoader, LoadModuleWarnsOnReservedWord)
{
  const auto bs = kernel_module(7).bytes();
  diagnostics ds(0, "k.spv", bs);
  module m = load_module(ds);
  EXPECT_EQ(m.functions.size(), 1u);
  ASSERT_EQ(ds.warnings().size(), 1u);
  EXPECT_EQ(ds.warnings()[0].at.offset, 16u);
}

TEST(ModuleLoader, LoadModuleThrowsLocatedDiagnostic)
{
  test::module_builder mb;
  mb.inst(spv::OpCapability, {6}).inst(0x1234, {1});
  const auto bs = mb.bytes();
  diagnostics ds(0, "bad.spv", bs);
  try {
    load_module(ds);
    FAIL() << "expected diagnostic";
  } catch (const diagnostic &d) {
    EXPECT_EQ(d.at.offset, 28u);
    EXPECT_EQ(d.at.index, 2u);
    EXPECT_EQ(d.path, "bad.spv");
    EXPECT_NE(d.message.find("unknown opcode (4660)"), std::string::npos);
    EXPECT_NE(d.str().find("bad.spv"), std::string::npos);
  }
}

TEST(ModuleLoader, LoaderErrorIsLocatedAtInstruction)
{
  test::module_builder mb;
  // OpNop has no place at module scope
  mb.inst(spv::OpCapability, {6}).inst(spv::OpNop);
  const auto bs = mb.bytes();
  diagnostics ds(0, "scope.spv", bs);
  try {
    load_module(ds);
    FAIL() << "expected diagnostic";
  } catch (const diagnostic &d) {
    EXPECT_EQ(d.level, diagnostic::ERROR);
    EXPECT_EQ(d.at.offset, 28u);
    EXPECT_EQ(d.at.index, 2u);
    EXPECT_EQ(d.at.extent, 4u);
    EXPECT_EQ(d.message,
      "consumer error: OpNop: found instruction not inside function");
  }
}

TEST(ModuleLoader, LocationOfHeaderErrors)
{
  std::vector<uint8_t> bs(12, 0);
  auto r = parse_result(S::HEADER_INCORRECT);
  EXPECT_EQ(location_of(r, bs).offset, 0u);
  EXPECT_EQ(location_of(r, bs).extent, 4u);
  EXPECT_FALSE(location_of(parse_result(S::CONSUMER_STOP_REQUESTED), bs)
    .has_context());
}
