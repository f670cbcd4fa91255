#include "module_loader.hpp"
#include "../grammar/spirv.hpp"
#include "../system.hpp"

#include <algorithm>

using namespace spvbin;

// instructions that may appear before the first function
static bool is_debug_op(uint16_t op)
{
  switch (op) {
  case spv::OpSourceContinued:
  case spv::OpSource:
  case spv::OpSourceExtension:
  case spv::OpName:
  case spv::OpMemberName:
  case spv::OpString:
  case spv::OpModuleProcessed:
    return true;
  default:
    return false;
  }
}
static bool is_annotation_op(uint16_t op)
{
  switch (op) {
  case spv::OpDecorate:
  case spv::OpMemberDecorate:
  case spv::OpDecorationGroup:
  case spv::OpGroupDecorate:
  case spv::OpGroupMemberDecorate:
  case spv::OpDecorateId:
  case spv::OpDecorateString:
  case spv::OpMemberDecorateString:
    return true;
  default:
    return false;
  }
}
static bool is_type_op(uint16_t op)
{
  return (op >= spv::OpTypeVoid && op <= spv::OpTypeForwardPointer) ||
    op == spv::OpTypePipeStorage;
}
static bool is_constant_op(uint16_t op)
{
  return op >= spv::OpConstantTrue && op <= spv::OpSpecConstantOp;
}
static bool is_block_terminator(uint16_t op)
{
  switch (op) {
  case spv::OpBranch:
  case spv::OpBranchConditional:
  case spv::OpSwitch:
  case spv::OpKill:
  case spv::OpReturn:
  case spv::OpReturnValue:
  case spv::OpUnreachable:
    return true;
  default:
    return false;
  }
}

action module_loader::initialize()
{
  m = module();
  curr_function = nullptr;
  curr_block = nullptr;
  return action::CONTINUE;
}

action module_loader::finalize()
{
  if (curr_block)
    return action::error("found unclosed basic block");
  if (curr_function)
    return action::error("found unclosed function");
  return action::CONTINUE;
}

action module_loader::consume_header(module_header h)
{
  m.header = h;
  return action::CONTINUE;
}

action module_loader::consume_instruction(instruction inst)
{
  // stop on the first instruction past the limit, so a module of exactly
  // max_instructions still completes
  if (max_instructions > 0 && m.instructions.size() >= max_instructions)
    return action::STOP;

  m.instructions.push_back(inst);

  const uint16_t op = inst.opcode;
  action a = action::CONTINUE;
  if (op == spv::OpCapability) {
    m.capabilities.push_back(std::move(inst));
  } else if (op == spv::OpExtension) {
    m.extensions.push_back(std::move(inst));
  } else if (op == spv::OpExtInstImport) {
    m.ext_inst_imports.push_back(std::move(inst));
  } else if (op == spv::OpMemoryModel) {
    if (m.memory_model)
      return action::error("detected multiple memory models");
    m.memory_model = std::move(inst);
  } else if (op == spv::OpEntryPoint) {
    m.entry_points.push_back(std::move(inst));
  } else if (op == spv::OpExecutionMode || op == spv::OpExecutionModeId) {
    m.execution_modes.push_back(std::move(inst));
  } else if (is_debug_op(op)) {
    m.debugs.push_back(std::move(inst));
  } else if (is_annotation_op(op)) {
    m.annotations.push_back(std::move(inst));
  } else if (is_type_op(op) || is_constant_op(op)) {
    m.types_global_values.push_back(std::move(inst));
  } else if (!curr_function &&
    (op == spv::OpVariable || op == spv::OpUndef ||
      op == spv::OpLine || op == spv::OpNoLine))
  {
    // module-scope variables (and the line info that precedes them)
    m.types_global_values.push_back(std::move(inst));
  } else {
    a = add_to_function(std::move(inst));
  }
  return a;
}

action module_loader::add_to_function(instruction &&inst)
{
  const uint16_t op = inst.opcode;
  if (op == spv::OpFunction) {
    if (curr_function)
      return action::error("found nested function");
    m.functions.emplace_back();
    curr_function = &m.functions.back();
    curr_function->def = std::move(inst);
  } else if (op == spv::OpFunctionEnd) {
    if (!curr_function)
      return action::error("found mismatched OpFunctionEnd");
    if (curr_block)
      return action::error("found unclosed basic block");
    curr_function->end = std::move(inst);
    curr_function = nullptr;
  } else if (op == spv::OpFunctionParameter) {
    if (!curr_function)
      return action::error("found function parameter not inside function");
    if (!curr_function->blocks.empty())
      return action::error("found function parameter after the first block");
    curr_function->parameters.push_back(std::move(inst));
  } else if (op == spv::OpLabel) {
    if (!curr_function)
      return action::error("found basic block not inside function");
    if (curr_block)
      return action::error("found nested basic block");
    curr_function->blocks.emplace_back();
    curr_block = &curr_function->blocks.back();
    curr_block->label = std::move(inst);
  } else if (!curr_function) {
    return action::error(
      text::format(opcode_name(op), ": found instruction not inside function"));
  } else if (!curr_block) {
    return action::error(
      text::format(opcode_name(op), ": found instruction not inside basic block"));
  } else {
    const bool terminates = is_block_terminator(op);
    curr_block->body.push_back(std::move(inst));
    if (terminates)
      curr_block = nullptr;
  }
  return action::CONTINUE;
}

///////////////////////////////////////////////////////////////////////////////
parse_result spvbin::load_bytes(
  std::vector<uint8_t> binary, module &m, int verbosity)
{
  module_loader l(m);
  return parse(std::move(binary), l, verbosity);
}

parse_result spvbin::load_words(
  const std::vector<uint32_t> &words, module &m, int verbosity)
{
  std::vector<uint8_t> bs;
  bs.reserve(words.size() * sizeof(uint32_t));
  for (uint32_t w : words) {
    bs.push_back((uint8_t)(w & 0xFF));
    bs.push_back((uint8_t)((w >> 8) & 0xFF));
    bs.push_back((uint8_t)((w >> 16) & 0xFF));
    bs.push_back((uint8_t)((w >> 24) & 0xFF));
  }
  return load_bytes(std::move(bs), m, verbosity);
}

loc spvbin::location_of(
  const parse_result &r, const std::vector<uint8_t> &bits)
{
  using S = parse_result::state;
  switch (r.st) {
  case S::HEADER_INCORRECT:
  case S::ENDIANNESS_UNSUPPORTED:
    return loc(0, 0, 4);
  case S::HEADER_INCOMPLETE:
    return loc(0, 0, (uint32_t)std::min<size_t>(bits.size(), 20));
  case S::OPERAND_ERROR:
    return loc((uint32_t)r.offset, 0, 4);
  case S::INSTRUCTION_INCOMPLETE:
  case S::WORD_COUNT_ZERO:
  case S::OPCODE_UNKNOWN:
  case S::OPERAND_EXPECTED:
  case S::OPERAND_EXCEEDED:
  case S::CONSUMER_ERROR:
    // a consumer error from initialize, header or finalize has no index
    if (r.index == 0)
      return NO_LOC;
    return loc((uint32_t)r.offset, (uint32_t)r.index,
      (uint32_t)std::min<size_t>(4, bits.size() - std::min(bits.size(), r.offset)));
  default:
    return NO_LOC;
  }
}

module spvbin::load_module(
  diagnostics &diags, size_t max_instructions, bool *stopped_early)
{
  module m;
  module_loader l(m, max_instructions);
  const parse_result r = parse(diags.input(), l, diags.verbosity());

  if (stopped_early)
    *stopped_early = r.stopped();
  if (r.stopped()) {
    diags.verbose_at(NO_LOC,
      "stopped after ", l.instructions_loaded(), " instructions");
  } else if (!r.succeeded()) {
    diags.fatal_at(location_of(r, diags.input()), r.str());
  }

  if (!m.header)
    diags.internal_at(NO_LOC, "parse succeeded without a module header");
  if (m.header->reserved != 0) {
    diags.warning_at(loc(16, 0, 4),
      "reserved header word is 0x", text::hex(m.header->reserved),
      " (expected 0)");
  }
  diags.debug_at(NO_LOC, "loaded ", m.instructions.size(), " instructions");
  return m;
}
