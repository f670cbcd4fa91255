#ifndef SPVBIN_GRAMMAR_OPERAND_KINDS_HPP
#define SPVBIN_GRAMMAR_OPERAND_KINDS_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace spvbin
{
  // Operand kinds as named by the SPIR-V grammar.  We keep the grammar's
  // spelling so table entries read like the JSON grammar.
  enum class operand_kind : uint16_t {
    // identifiers
    IdResultType,
    IdResult,
    IdRef,
    IdScope,
    IdMemorySemantics,
    // literals
    LiteralInteger,
    LiteralString,
    LiteralContextDependentNumber,
    LiteralExtInstInteger,
    LiteralSpecConstantOpInteger,
    // composites
    PairLiteralIntegerIdRef,
    PairIdRefLiteralInteger,
    PairIdRefIdRef,
    // bit enums
    ImageOperands,
    FPFastMathMode,
    SelectionControl,
    LoopControl,
    FunctionControl,
    MemoryAccess,
    // value enums
    SourceLanguage,
    ExecutionModel,
    AddressingModel,
    MemoryModel,
    ExecutionMode,
    StorageClass,
    Dim,
    SamplerAddressingMode,
    SamplerFilterMode,
    ImageFormat,
    FPRoundingMode,
    LinkageType,
    AccessQualifier,
    FunctionParameterAttribute,
    Decoration,
    BuiltIn,
    Capability,
  }; // operand_kind

  enum class operand_category {
    ID,
    LITERAL_NUMBER,
    LITERAL_STRING,
    BIT_ENUM,
    VALUE_ENUM,
    COMPOSITE,
  };

  // e.g. Decoration's ArrayStride mandates one LiteralInteger
  struct enumerant {
    const char                *symbol;
    uint32_t                   value;
    std::vector<operand_kind>  parameters;
  };

  struct operand_kind_info {
    operand_kind               kind;
    const char                *name;
    operand_category           category;
    // words per literal; 0 means the width depends on context
    // (e.g. the result type of OpConstant)
    uint32_t                   literal_words = 0;
    // sub-kinds of a composite in stream order
    std::vector<operand_kind>  members;
    std::vector<enumerant>     enumerants;

    bool is_enum() const {
      return category == operand_category::BIT_ENUM ||
        category == operand_category::VALUE_ENUM;
    }
  };

  // the table is built on first use and never mutated afterwards
  const operand_kind_info          &lookup_operand_kind(operand_kind k);
  const std::vector<operand_kind_info>
                                   &all_operand_kinds();
  const char                       *operand_kind_name(operand_kind k);

  // exact value match (for a bit enum this only matches single bits or 0)
  const enumerant                  *find_enumerant(
    const operand_kind_info &oki, uint32_t value);

  // renders an enumerant value symbolically: "Kernel", "Inline|Const",
  // or a hex fallback for bits or values that have no symbol
  std::string                       format_enumerant(
    const operand_kind_info &oki, uint32_t value);
} // namespace spvbin

#endif
