#include "grammar_table.hpp"
#include "spirv.hpp"

#include <unordered_map>

using namespace spvbin;

using K = operand_kind;
using Q = quantifier;

static constexpr logical_operand one(K k) {return logical_operand{k, Q::ONE};}
static constexpr logical_operand opt(K k) {return logical_operand{k, Q::ZERO_OR_ONE};}
static constexpr logical_operand any(K k) {return logical_operand{k, Q::ZERO_OR_MORE};}

// the common shapes
static constexpr logical_operand TY  = one(K::IdResultType);
static constexpr logical_operand RS  = one(K::IdResult);
static constexpr logical_operand RF  = one(K::IdRef);
static constexpr logical_operand LI  = one(K::LiteralInteger);
static constexpr logical_operand LS  = one(K::LiteralString);
static constexpr logical_operand SCP = one(K::IdScope);
static constexpr logical_operand SEM = one(K::IdMemorySemantics);

///////////////////////////////////////////////////////////////////////////////
// SPIR-V core instructions grouped as in the specification's
// "Instructions" chapter.  Operands follow the grammar order exactly.
static std::vector<instruction_grammar> build_instructions()
{
  return std::vector<instruction_grammar> {
    // miscellaneous
    {"OpNop",                 spv::OpNop,                 {}},
    {"OpUndef",               spv::OpUndef,               {TY, RS}},
    {"OpSizeOf",              spv::OpSizeOf,              {TY, RS, RF}},
    // debug
    {"OpSourceContinued",     spv::OpSourceContinued,     {LS}},
    {"OpSource",              spv::OpSource,
      {one(K::SourceLanguage), LI, opt(K::IdRef), opt(K::LiteralString)}},
    {"OpSourceExtension",     spv::OpSourceExtension,     {LS}},
    {"OpName",                spv::OpName,                {RF, LS}},
    {"OpMemberName",          spv::OpMemberName,          {RF, LI, LS}},
    {"OpString",              spv::OpString,              {RS, LS}},
    {"OpLine",                spv::OpLine,                {RF, LI, LI}},
    {"OpNoLine",              spv::OpNoLine,              {}},
    {"OpModuleProcessed",     spv::OpModuleProcessed,     {LS}},
    // annotation
    {"OpDecorate",            spv::OpDecorate,            {RF, one(K::Decoration)}},
    {"OpMemberDecorate",      spv::OpMemberDecorate,
      {RF, LI, one(K::Decoration)}},
    {"OpDecorationGroup",     spv::OpDecorationGroup,     {RS}},
    {"OpGroupDecorate",       spv::OpGroupDecorate,       {RF, any(K::IdRef)}},
    {"OpGroupMemberDecorate", spv::OpGroupMemberDecorate,
      {RF, any(K::PairIdRefLiteralInteger)}},
    {"OpDecorateId",          spv::OpDecorateId,          {RF, one(K::Decoration)}},
    {"OpDecorateString",      spv::OpDecorateString,      {RF, one(K::Decoration)}},
    {"OpMemberDecorateString", spv::OpMemberDecorateString,
      {RF, LI, one(K::Decoration)}},
    // extension
    {"OpExtension",           spv::OpExtension,           {LS}},
    {"OpExtInstImport",       spv::OpExtInstImport,       {RS, LS}},
    {"OpExtInst",             spv::OpExtInst,
      {TY, RS, RF, one(K::LiteralExtInstInteger), any(K::IdRef)}},
    // mode setting
    {"OpMemoryModel",         spv::OpMemoryModel,
      {one(K::AddressingModel), one(K::MemoryModel)}},
    {"OpEntryPoint",          spv::OpEntryPoint,
      {one(K::ExecutionModel), RF, LS, any(K::IdRef)}},
    {"OpExecutionMode",       spv::OpExecutionMode,
      {RF, one(K::ExecutionMode)}},
    {"OpExecutionModeId",     spv::OpExecutionModeId,
      {RF, one(K::ExecutionMode)}},
    {"OpCapability",          spv::OpCapability,          {one(K::Capability)}},
    // type declaration
    {"OpTypeVoid",            spv::OpTypeVoid,            {RS}},
    {"OpTypeBool",            spv::OpTypeBool,            {RS}},
    {"OpTypeInt",             spv::OpTypeInt,             {RS, LI, LI}},
    {"OpTypeFloat",           spv::OpTypeFloat,           {RS, LI}},
    {"OpTypeVector",          spv::OpTypeVector,          {RS, RF, LI}},
    {"OpTypeMatrix",          spv::OpTypeMatrix,          {RS, RF, LI}},
    {"OpTypeImage",           spv::OpTypeImage,
      {RS, RF, one(K::Dim), LI, LI, LI, LI, one(K::ImageFormat),
       opt(K::AccessQualifier)}},
    {"OpTypeSampler",         spv::OpTypeSampler,         {RS}},
    {"OpTypeSampledImage",    spv::OpTypeSampledImage,    {RS, RF}},
    {"OpTypeArray",           spv::OpTypeArray,           {RS, RF, RF}},
    {"OpTypeRuntimeArray",    spv::OpTypeRuntimeArray,    {RS, RF}},
    {"OpTypeStruct",          spv::OpTypeStruct,          {RS, any(K::IdRef)}},
    {"OpTypeOpaque",          spv::OpTypeOpaque,          {RS, LS}},
    {"OpTypePointer",         spv::OpTypePointer,
      {RS, one(K::StorageClass), RF}},
    {"OpTypeFunction",        spv::OpTypeFunction,        {RS, RF, any(K::IdRef)}},
    {"OpTypeEvent",           spv::OpTypeEvent,           {RS}},
    {"OpTypeDeviceEvent",     spv::OpTypeDeviceEvent,     {RS}},
    {"OpTypeReserveId",       spv::OpTypeReserveId,       {RS}},
    {"OpTypeQueue",           spv::OpTypeQueue,           {RS}},
    {"OpTypePipe",            spv::OpTypePipe,            {RS, one(K::AccessQualifier)}},
    {"OpTypeForwardPointer",  spv::OpTypeForwardPointer,  {RF, one(K::StorageClass)}},
    {"OpTypePipeStorage",     spv::OpTypePipeStorage,     {RS}},
    // constant creation
    {"OpConstantTrue",        spv::OpConstantTrue,        {TY, RS}},
    {"OpConstantFalse",       spv::OpConstantFalse,       {TY, RS}},
    {"OpConstant",            spv::OpConstant,
      {TY, RS, one(K::LiteralContextDependentNumber)}},
    {"OpConstantComposite",   spv::OpConstantComposite,   {TY, RS, any(K::IdRef)}},
    {"OpConstantSampler",     spv::OpConstantSampler,
      {TY, RS, one(K::SamplerAddressingMode), LI, one(K::SamplerFilterMode)}},
    {"OpConstantNull",        spv::OpConstantNull,        {TY, RS}},
    {"OpSpecConstantTrue",    spv::OpSpecConstantTrue,    {TY, RS}},
    {"OpSpecConstantFalse",   spv::OpSpecConstantFalse,   {TY, RS}},
    {"OpSpecConstant",        spv::OpSpecConstant,
      {TY, RS, one(K::LiteralContextDependentNumber)}},
    {"OpSpecConstantComposite", spv::OpSpecConstantComposite,
      {TY, RS, any(K::IdRef)}},
    {"OpSpecConstantOp",      spv::OpSpecConstantOp,
      {TY, RS, one(K::LiteralSpecConstantOpInteger), any(K::IdRef)}},
    // memory
    {"OpVariable",            spv::OpVariable,
      {TY, RS, one(K::StorageClass), opt(K::IdRef)}},
    {"OpImageTexelPointer",   spv::OpImageTexelPointer,   {TY, RS, RF, RF, RF}},
    {"OpLoad",                spv::OpLoad,
      {TY, RS, RF, opt(K::MemoryAccess)}},
    {"OpStore",               spv::OpStore,               {RF, RF, opt(K::MemoryAccess)}},
    {"OpCopyMemory",          spv::OpCopyMemory,          {RF, RF, opt(K::MemoryAccess)}},
    {"OpCopyMemorySized",     spv::OpCopyMemorySized,
      {RF, RF, RF, opt(K::MemoryAccess)}},
    {"OpAccessChain",         spv::OpAccessChain,         {TY, RS, RF, any(K::IdRef)}},
    {"OpInBoundsAccessChain", spv::OpInBoundsAccessChain, {TY, RS, RF, any(K::IdRef)}},
    {"OpPtrAccessChain",      spv::OpPtrAccessChain,
      {TY, RS, RF, RF, any(K::IdRef)}},
    {"OpArrayLength",         spv::OpArrayLength,         {TY, RS, RF, LI}},
    {"OpGenericPtrMemSemantics", spv::OpGenericPtrMemSemantics, {TY, RS, RF}},
    {"OpInBoundsPtrAccessChain", spv::OpInBoundsPtrAccessChain,
      {TY, RS, RF, RF, any(K::IdRef)}},
    // function
    {"OpFunction",            spv::OpFunction,
      {TY, RS, one(K::FunctionControl), RF}},
    {"OpFunctionParameter",   spv::OpFunctionParameter,   {TY, RS}},
    {"OpFunctionEnd",         spv::OpFunctionEnd,         {}},
    {"OpFunctionCall",        spv::OpFunctionCall,        {TY, RS, RF, any(K::IdRef)}},
    // image
    {"OpSampledImage",        spv::OpSampledImage,        {TY, RS, RF, RF}},
    {"OpImageSampleImplicitLod", spv::OpImageSampleImplicitLod,
      {TY, RS, RF, RF, opt(K::ImageOperands)}},
    {"OpImageSampleExplicitLod", spv::OpImageSampleExplicitLod,
      {TY, RS, RF, RF, one(K::ImageOperands)}},
    {"OpImageSampleDrefImplicitLod", spv::OpImageSampleDrefImplicitLod,
      {TY, RS, RF, RF, RF, opt(K::ImageOperands)}},
    {"OpImageSampleDrefExplicitLod", spv::OpImageSampleDrefExplicitLod,
      {TY, RS, RF, RF, RF, one(K::ImageOperands)}},
    {"OpImageSampleProjImplicitLod", spv::OpImageSampleProjImplicitLod,
      {TY, RS, RF, RF, opt(K::ImageOperands)}},
    {"OpImageSampleProjExplicitLod", spv::OpImageSampleProjExplicitLod,
      {TY, RS, RF, RF, one(K::ImageOperands)}},
    {"OpImageSampleProjDrefImplicitLod", spv::OpImageSampleProjDrefImplicitLod,
      {TY, RS, RF, RF, RF, opt(K::ImageOperands)}},
    {"OpImageSampleProjDrefExplicitLod", spv::OpImageSampleProjDrefExplicitLod,
      {TY, RS, RF, RF, RF, one(K::ImageOperands)}},
    {"OpImageFetch",          spv::OpImageFetch,
      {TY, RS, RF, RF, opt(K::ImageOperands)}},
    {"OpImageGather",         spv::OpImageGather,
      {TY, RS, RF, RF, RF, opt(K::ImageOperands)}},
    {"OpImageDrefGather",     spv::OpImageDrefGather,
      {TY, RS, RF, RF, RF, opt(K::ImageOperands)}},
    {"OpImageRead",           spv::OpImageRead,
      {TY, RS, RF, RF, opt(K::ImageOperands)}},
    {"OpImageWrite",          spv::OpImageWrite,
      {RF, RF, RF, opt(K::ImageOperands)}},
    {"OpImage",               spv::OpImage,               {TY, RS, RF}},
    {"OpImageQueryFormat",    spv::OpImageQueryFormat,    {TY, RS, RF}},
    {"OpImageQueryOrder",     spv::OpImageQueryOrder,     {TY, RS, RF}},
    {"OpImageQuerySizeLod",   spv::OpImageQuerySizeLod,   {TY, RS, RF, RF}},
    {"OpImageQuerySize",      spv::OpImageQuerySize,      {TY, RS, RF}},
    {"OpImageQueryLod",       spv::OpImageQueryLod,       {TY, RS, RF, RF}},
    {"OpImageQueryLevels",    spv::OpImageQueryLevels,    {TY, RS, RF}},
    {"OpImageQuerySamples",   spv::OpImageQuerySamples,   {TY, RS, RF}},
    // conversion
    {"OpConvertFToU",         spv::OpConvertFToU,         {TY, RS, RF}},
    {"OpConvertFToS",         spv::OpConvertFToS,         {TY, RS, RF}},
    {"OpConvertSToF",         spv::OpConvertSToF,         {TY, RS, RF}},
    {"OpConvertUToF",         spv::OpConvertUToF,         {TY, RS, RF}},
    {"OpUConvert",            spv::OpUConvert,            {TY, RS, RF}},
    {"OpSConvert",            spv::OpSConvert,            {TY, RS, RF}},
    {"OpFConvert",            spv::OpFConvert,            {TY, RS, RF}},
    {"OpQuantizeToF16",       spv::OpQuantizeToF16,       {TY, RS, RF}},
    {"OpConvertPtrToU",       spv::OpConvertPtrToU,       {TY, RS, RF}},
    {"OpSatConvertSToU",      spv::OpSatConvertSToU,      {TY, RS, RF}},
    {"OpSatConvertUToS",      spv::OpSatConvertUToS,      {TY, RS, RF}},
    {"OpConvertUToPtr",       spv::OpConvertUToPtr,       {TY, RS, RF}},
    {"OpPtrCastToGeneric",    spv::OpPtrCastToGeneric,    {TY, RS, RF}},
    {"OpGenericCastToPtr",    spv::OpGenericCastToPtr,    {TY, RS, RF}},
    {"OpGenericCastToPtrExplicit", spv::OpGenericCastToPtrExplicit,
      {TY, RS, RF, one(K::StorageClass)}},
    {"OpBitcast",             spv::OpBitcast,             {TY, RS, RF}},
    // composite
    {"OpVectorExtractDynamic", spv::OpVectorExtractDynamic, {TY, RS, RF, RF}},
    {"OpVectorInsertDynamic", spv::OpVectorInsertDynamic, {TY, RS, RF, RF, RF}},
    {"OpVectorShuffle",       spv::OpVectorShuffle,
      {TY, RS, RF, RF, any(K::LiteralInteger)}},
    {"OpCompositeConstruct",  spv::OpCompositeConstruct,  {TY, RS, any(K::IdRef)}},
    {"OpCompositeExtract",    spv::OpCompositeExtract,
      {TY, RS, RF, any(K::LiteralInteger)}},
    {"OpCompositeInsert",     spv::OpCompositeInsert,
      {TY, RS, RF, RF, any(K::LiteralInteger)}},
    {"OpCopyObject",          spv::OpCopyObject,          {TY, RS, RF}},
    {"OpTranspose",           spv::OpTranspose,           {TY, RS, RF}},
    // arithmetic
    {"OpSNegate",             spv::OpSNegate,             {TY, RS, RF}},
    {"OpFNegate",             spv::OpFNegate,             {TY, RS, RF}},
    {"OpIAdd",                spv::OpIAdd,                {TY, RS, RF, RF}},
    {"OpFAdd",                spv::OpFAdd,                {TY, RS, RF, RF}},
    {"OpISub",                spv::OpISub,                {TY, RS, RF, RF}},
    {"OpFSub",                spv::OpFSub,                {TY, RS, RF, RF}},
    {"OpIMul",                spv::OpIMul,                {TY, RS, RF, RF}},
    {"OpFMul",                spv::OpFMul,                {TY, RS, RF, RF}},
    {"OpUDiv",                spv::OpUDiv,                {TY, RS, RF, RF}},
    {"OpSDiv",                spv::OpSDiv,                {TY, RS, RF, RF}},
    {"OpFDiv",                spv::OpFDiv,                {TY, RS, RF, RF}},
    {"OpUMod",                spv::OpUMod,                {TY, RS, RF, RF}},
    {"OpSRem",                spv::OpSRem,                {TY, RS, RF, RF}},
    {"OpSMod",                spv::OpSMod,                {TY, RS, RF, RF}},
    {"OpFRem",                spv::OpFRem,                {TY, RS, RF, RF}},
    {"OpFMod",                spv::OpFMod,                {TY, RS, RF, RF}},
    {"OpVectorTimesScalar",   spv::OpVectorTimesScalar,   {TY, RS, RF, RF}},
    {"OpMatrixTimesScalar",   spv::OpMatrixTimesScalar,   {TY, RS, RF, RF}},
    {"OpVectorTimesMatrix",   spv::OpVectorTimesMatrix,   {TY, RS, RF, RF}},
    {"OpMatrixTimesVector",   spv::OpMatrixTimesVector,   {TY, RS, RF, RF}},
    {"OpMatrixTimesMatrix",   spv::OpMatrixTimesMatrix,   {TY, RS, RF, RF}},
    {"OpOuterProduct",        spv::OpOuterProduct,        {TY, RS, RF, RF}},
    {"OpDot",                 spv::OpDot,                 {TY, RS, RF, RF}},
    {"OpIAddCarry",           spv::OpIAddCarry,           {TY, RS, RF, RF}},
    {"OpISubBorrow",          spv::OpISubBorrow,          {TY, RS, RF, RF}},
    {"OpUMulExtended",        spv::OpUMulExtended,        {TY, RS, RF, RF}},
    {"OpSMulExtended",        spv::OpSMulExtended,        {TY, RS, RF, RF}},
    // relational and logical
    {"OpAny",                 spv::OpAny,                 {TY, RS, RF}},
    {"OpAll",                 spv::OpAll,                 {TY, RS, RF}},
    {"OpIsNan",               spv::OpIsNan,               {TY, RS, RF}},
    {"OpIsInf",               spv::OpIsInf,               {TY, RS, RF}},
    {"OpIsFinite",            spv::OpIsFinite,            {TY, RS, RF}},
    {"OpIsNormal",            spv::OpIsNormal,            {TY, RS, RF}},
    {"OpSignBitSet",          spv::OpSignBitSet,          {TY, RS, RF}},
    {"OpLessOrGreater",       spv::OpLessOrGreater,       {TY, RS, RF, RF}},
    {"OpOrdered",             spv::OpOrdered,             {TY, RS, RF, RF}},
    {"OpUnordered",           spv::OpUnordered,           {TY, RS, RF, RF}},
    {"OpLogicalEqual",        spv::OpLogicalEqual,        {TY, RS, RF, RF}},
    {"OpLogicalNotEqual",     spv::OpLogicalNotEqual,     {TY, RS, RF, RF}},
    {"OpLogicalOr",           spv::OpLogicalOr,           {TY, RS, RF, RF}},
    {"OpLogicalAnd",          spv::OpLogicalAnd,          {TY, RS, RF, RF}},
    {"OpLogicalNot",          spv::OpLogicalNot,          {TY, RS, RF}},
    {"OpSelect",              spv::OpSelect,              {TY, RS, RF, RF, RF}},
    {"OpIEqual",              spv::OpIEqual,              {TY, RS, RF, RF}},
    {"OpINotEqual",           spv::OpINotEqual,           {TY, RS, RF, RF}},
    {"OpUGreaterThan",        spv::OpUGreaterThan,        {TY, RS, RF, RF}},
    {"OpSGreaterThan",        spv::OpSGreaterThan,        {TY, RS, RF, RF}},
    {"OpUGreaterThanEqual",   spv::OpUGreaterThanEqual,   {TY, RS, RF, RF}},
    {"OpSGreaterThanEqual",   spv::OpSGreaterThanEqual,   {TY, RS, RF, RF}},
    {"OpULessThan",           spv::OpULessThan,           {TY, RS, RF, RF}},
    {"OpSLessThan",           spv::OpSLessThan,           {TY, RS, RF, RF}},
    {"OpULessThanEqual",      spv::OpULessThanEqual,      {TY, RS, RF, RF}},
    {"OpSLessThanEqual",      spv::OpSLessThanEqual,      {TY, RS, RF, RF}},
    {"OpFOrdEqual",           spv::OpFOrdEqual,           {TY, RS, RF, RF}},
    {"OpFUnordEqual",         spv::OpFUnordEqual,         {TY, RS, RF, RF}},
    {"OpFOrdNotEqual",        spv::OpFOrdNotEqual,        {TY, RS, RF, RF}},
    {"OpFUnordNotEqual",      spv::OpFUnordNotEqual,      {TY, RS, RF, RF}},
    {"OpFOrdLessThan",        spv::OpFOrdLessThan,        {TY, RS, RF, RF}},
    {"OpFUnordLessThan",      spv::OpFUnordLessThan,      {TY, RS, RF, RF}},
    {"OpFOrdGreaterThan",     spv::OpFOrdGreaterThan,     {TY, RS, RF, RF}},
    {"OpFUnordGreaterThan",   spv::OpFUnordGreaterThan,   {TY, RS, RF, RF}},
    {"OpFOrdLessThanEqual",   spv::OpFOrdLessThanEqual,   {TY, RS, RF, RF}},
    {"OpFUnordLessThanEqual", spv::OpFUnordLessThanEqual, {TY, RS, RF, RF}},
    {"OpFOrdGreaterThanEqual", spv::OpFOrdGreaterThanEqual, {TY, RS, RF, RF}},
    {"OpFUnordGreaterThanEqual", spv::OpFUnordGreaterThanEqual, {TY, RS, RF, RF}},
    // bit
    {"OpShiftRightLogical",   spv::OpShiftRightLogical,   {TY, RS, RF, RF}},
    {"OpShiftRightArithmetic", spv::OpShiftRightArithmetic, {TY, RS, RF, RF}},
    {"OpShiftLeftLogical",    spv::OpShiftLeftLogical,    {TY, RS, RF, RF}},
    {"OpBitwiseOr",           spv::OpBitwiseOr,           {TY, RS, RF, RF}},
    {"OpBitwiseXor",          spv::OpBitwiseXor,          {TY, RS, RF, RF}},
    {"OpBitwiseAnd",          spv::OpBitwiseAnd,          {TY, RS, RF, RF}},
    {"OpNot",                 spv::OpNot,                 {TY, RS, RF}},
    {"OpBitFieldInsert",      spv::OpBitFieldInsert,      {TY, RS, RF, RF, RF, RF}},
    {"OpBitFieldSExtract",    spv::OpBitFieldSExtract,    {TY, RS, RF, RF, RF}},
    {"OpBitFieldUExtract",    spv::OpBitFieldUExtract,    {TY, RS, RF, RF, RF}},
    {"OpBitReverse",          spv::OpBitReverse,          {TY, RS, RF}},
    {"OpBitCount",            spv::OpBitCount,            {TY, RS, RF}},
    // derivative
    {"OpDPdx",                spv::OpDPdx,                {TY, RS, RF}},
    {"OpDPdy",                spv::OpDPdy,                {TY, RS, RF}},
    {"OpFwidth",              spv::OpFwidth,              {TY, RS, RF}},
    {"OpDPdxFine",            spv::OpDPdxFine,            {TY, RS, RF}},
    {"OpDPdyFine",            spv::OpDPdyFine,            {TY, RS, RF}},
    {"OpFwidthFine",          spv::OpFwidthFine,          {TY, RS, RF}},
    {"OpDPdxCoarse",          spv::OpDPdxCoarse,          {TY, RS, RF}},
    {"OpDPdyCoarse",          spv::OpDPdyCoarse,          {TY, RS, RF}},
    {"OpFwidthCoarse",        spv::OpFwidthCoarse,        {TY, RS, RF}},
    // primitive
    {"OpEmitVertex",          spv::OpEmitVertex,          {}},
    {"OpEndPrimitive",        spv::OpEndPrimitive,        {}},
    {"OpEmitStreamVertex",    spv::OpEmitStreamVertex,    {RF}},
    {"OpEndStreamPrimitive",  spv::OpEndStreamPrimitive,  {RF}},
    // barrier
    {"OpControlBarrier",      spv::OpControlBarrier,      {SCP, SCP, SEM}},
    {"OpMemoryBarrier",       spv::OpMemoryBarrier,       {SCP, SEM}},
    // atomic
    {"OpAtomicLoad",          spv::OpAtomicLoad,          {TY, RS, RF, SCP, SEM}},
    {"OpAtomicStore",         spv::OpAtomicStore,         {RF, SCP, SEM, RF}},
    {"OpAtomicExchange",      spv::OpAtomicExchange,      {TY, RS, RF, SCP, SEM, RF}},
    {"OpAtomicCompareExchange", spv::OpAtomicCompareExchange,
      {TY, RS, RF, SCP, SEM, SEM, RF, RF}},
    {"OpAtomicCompareExchangeWeak", spv::OpAtomicCompareExchangeWeak,
      {TY, RS, RF, SCP, SEM, SEM, RF, RF}},
    {"OpAtomicIIncrement",    spv::OpAtomicIIncrement,    {TY, RS, RF, SCP, SEM}},
    {"OpAtomicIDecrement",    spv::OpAtomicIDecrement,    {TY, RS, RF, SCP, SEM}},
    {"OpAtomicIAdd",          spv::OpAtomicIAdd,          {TY, RS, RF, SCP, SEM, RF}},
    {"OpAtomicISub",          spv::OpAtomicISub,          {TY, RS, RF, SCP, SEM, RF}},
    {"OpAtomicSMin",          spv::OpAtomicSMin,          {TY, RS, RF, SCP, SEM, RF}},
    {"OpAtomicUMin",          spv::OpAtomicUMin,          {TY, RS, RF, SCP, SEM, RF}},
    {"OpAtomicSMax",          spv::OpAtomicSMax,          {TY, RS, RF, SCP, SEM, RF}},
    {"OpAtomicUMax",          spv::OpAtomicUMax,          {TY, RS, RF, SCP, SEM, RF}},
    {"OpAtomicAnd",           spv::OpAtomicAnd,           {TY, RS, RF, SCP, SEM, RF}},
    {"OpAtomicOr",            spv::OpAtomicOr,            {TY, RS, RF, SCP, SEM, RF}},
    {"OpAtomicXor",           spv::OpAtomicXor,           {TY, RS, RF, SCP, SEM, RF}},
    // control flow
    {"OpPhi",                 spv::OpPhi,                 {TY, RS, any(K::PairIdRefIdRef)}},
    {"OpLoopMerge",           spv::OpLoopMerge,           {RF, RF, one(K::LoopControl)}},
    {"OpSelectionMerge",      spv::OpSelectionMerge,      {RF, one(K::SelectionControl)}},
    {"OpLabel",               spv::OpLabel,               {RS}},
    {"OpBranch",              spv::OpBranch,              {RF}},
    {"OpBranchConditional",   spv::OpBranchConditional,
      {RF, RF, RF, any(K::LiteralInteger)}},
    {"OpSwitch",              spv::OpSwitch,
      {RF, RF, any(K::PairLiteralIntegerIdRef)}},
    {"OpKill",                spv::OpKill,                {}},
    {"OpReturn",              spv::OpReturn,              {}},
    {"OpReturnValue",         spv::OpReturnValue,         {RF}},
    {"OpUnreachable",         spv::OpUnreachable,         {}},
    {"OpLifetimeStart",       spv::OpLifetimeStart,       {RF, LI}},
    {"OpLifetimeStop",        spv::OpLifetimeStop,        {RF, LI}},
  };
}

const std::vector<instruction_grammar> &spvbin::all_instructions()
{
  static const std::vector<instruction_grammar> insts = build_instructions();
  return insts;
}

const instruction_grammar *spvbin::lookup_opcode(uint16_t opcode)
{
  static const std::unordered_map<uint16_t,const instruction_grammar *>
    by_opcode = [] {
      std::unordered_map<uint16_t,const instruction_grammar *> m;
      for (const auto &ig : all_instructions())
        m[ig.opcode] = &ig;
      return m;
    }();
  auto itr = by_opcode.find(opcode);
  if (itr == by_opcode.end())
    return nullptr;
  return itr->second;
}

const char *spvbin::opcode_name(uint16_t opcode)
{
  const instruction_grammar *ig = lookup_opcode(opcode);
  return ig ? ig->opname : "Op???";
}
