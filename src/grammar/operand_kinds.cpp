#include "operand_kinds.hpp"
#include "../text.hpp"

#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

using namespace spvbin;

using K = operand_kind;
using C = operand_category;

static operand_kind_info id_kind(K k, const char *nm) {
  return operand_kind_info{k, nm, C::ID, 1, {}, {}};
}
static operand_kind_info literal_kind(K k, const char *nm, uint32_t words) {
  return operand_kind_info{k, nm, C::LITERAL_NUMBER, words, {}, {}};
}
static operand_kind_info pair_kind(K k, const char *nm, K fst, K snd) {
  return operand_kind_info{k, nm, C::COMPOSITE, 0, {fst, snd}, {}};
}
static operand_kind_info bit_enum(
  K k, const char *nm, std::vector<enumerant> es)
{
  return operand_kind_info{k, nm, C::BIT_ENUM, 1, {}, std::move(es)};
}
static operand_kind_info value_enum(
  K k, const char *nm, std::vector<enumerant> es)
{
  return operand_kind_info{k, nm, C::VALUE_ENUM, 1, {}, std::move(es)};
}

///////////////////////////////////////////////////////////////////////////////
// The operand kinds referenced by grammar_table.cpp (SPIR-V 1.0 enumerants
// plus the few later additions the instruction table needs).
static std::vector<operand_kind_info> build_operand_kinds()
{
  const K LI = K::LiteralInteger;
  const K ID = K::IdRef;

  std::vector<operand_kind_info> ks;
  ks.push_back(id_kind(K::IdResultType, "IdResultType"));
  ks.push_back(id_kind(K::IdResult, "IdResult"));
  ks.push_back(id_kind(K::IdRef, "IdRef"));
  ks.push_back(id_kind(K::IdScope, "IdScope"));
  ks.push_back(id_kind(K::IdMemorySemantics, "IdMemorySemantics"));
  //
  ks.push_back(literal_kind(K::LiteralInteger, "LiteralInteger", 1));
  ks.push_back(operand_kind_info{
    K::LiteralString, "LiteralString", C::LITERAL_STRING, 0, {}, {}});
  ks.push_back(literal_kind(
    K::LiteralContextDependentNumber, "LiteralContextDependentNumber", 0));
  ks.push_back(literal_kind(
    K::LiteralExtInstInteger, "LiteralExtInstInteger", 1));
  ks.push_back(literal_kind(
    K::LiteralSpecConstantOpInteger, "LiteralSpecConstantOpInteger", 1));
  //
  ks.push_back(pair_kind(K::PairLiteralIntegerIdRef,
    "PairLiteralIntegerIdRef", LI, ID));
  ks.push_back(pair_kind(K::PairIdRefLiteralInteger,
    "PairIdRefLiteralInteger", ID, LI));
  ks.push_back(pair_kind(K::PairIdRefIdRef,
    "PairIdRefIdRef", ID, ID));

  /////////////////////////////////////////////////////////////////////////////
  // bit enums
  ks.push_back(bit_enum(K::ImageOperands, "ImageOperands", {
    {"None",          0x00, {}},
    {"Bias",          0x01, {ID}},
    {"Lod",           0x02, {ID}},
    {"Grad",          0x04, {ID, ID}},
    {"ConstOffset",   0x08, {ID}},
    {"Offset",        0x10, {ID}},
    {"ConstOffsets",  0x20, {ID}},
    {"Sample",        0x40, {ID}},
    {"MinLod",        0x80, {ID}},
  }));
  ks.push_back(bit_enum(K::FPFastMathMode, "FPFastMathMode", {
    {"None",          0x00, {}},
    {"NotNaN",        0x01, {}},
    {"NotInf",        0x02, {}},
    {"NSZ",           0x04, {}},
    {"AllowRecip",    0x08, {}},
    {"Fast",          0x10, {}},
  }));
  ks.push_back(bit_enum(K::SelectionControl, "SelectionControl", {
    {"None",          0x0, {}},
    {"Flatten",       0x1, {}},
    {"DontFlatten",   0x2, {}},
  }));
  ks.push_back(bit_enum(K::LoopControl, "LoopControl", {
    {"None",               0x0, {}},
    {"Unroll",             0x1, {}},
    {"DontUnroll",         0x2, {}},
    {"DependencyInfinite", 0x4, {}},
    {"DependencyLength",   0x8, {LI}},
  }));
  ks.push_back(bit_enum(K::FunctionControl, "FunctionControl", {
    {"None",          0x0, {}},
    {"Inline",        0x1, {}},
    {"DontInline",    0x2, {}},
    {"Pure",          0x4, {}},
    {"Const",         0x8, {}},
  }));
  ks.push_back(bit_enum(K::MemoryAccess, "MemoryAccess", {
    {"None",          0x0, {}},
    {"Volatile",      0x1, {}},
    {"Aligned",       0x2, {LI}},
    {"Nontemporal",   0x4, {}},
  }));

  /////////////////////////////////////////////////////////////////////////////
  // value enums
  ks.push_back(value_enum(K::SourceLanguage, "SourceLanguage", {
    {"Unknown",    0, {}},
    {"ESSL",       1, {}},
    {"GLSL",       2, {}},
    {"OpenCL_C",   3, {}},
    {"OpenCL_CPP", 4, {}},
    {"HLSL",       5, {}},
  }));
  ks.push_back(value_enum(K::ExecutionModel, "ExecutionModel", {
    {"Vertex",                 0, {}},
    {"TessellationControl",    1, {}},
    {"TessellationEvaluation", 2, {}},
    {"Geometry",               3, {}},
    {"Fragment",               4, {}},
    {"GLCompute",              5, {}},
    {"Kernel",                 6, {}},
  }));
  ks.push_back(value_enum(K::AddressingModel, "AddressingModel", {
    {"Logical",                    0, {}},
    {"Physical32",                 1, {}},
    {"Physical64",                 2, {}},
    {"PhysicalStorageBuffer64", 5348, {}},
  }));
  ks.push_back(value_enum(K::MemoryModel, "MemoryModel", {
    {"Simple",  0, {}},
    {"GLSL450", 1, {}},
    {"OpenCL",  2, {}},
    {"Vulkan",  3, {}},
  }));
  ks.push_back(value_enum(K::ExecutionMode, "ExecutionMode", {
    {"Invocations",              0, {LI}},
    {"SpacingEqual",             1, {}},
    {"SpacingFractionalEven",    2, {}},
    {"SpacingFractionalOdd",     3, {}},
    {"VertexOrderCw",            4, {}},
    {"VertexOrderCcw",           5, {}},
    {"PixelCenterInteger",       6, {}},
    {"OriginUpperLeft",          7, {}},
    {"OriginLowerLeft",          8, {}},
    {"EarlyFragmentTests",       9, {}},
    {"PointMode",               10, {}},
    {"Xfb",                     11, {}},
    {"DepthReplacing",          12, {}},
    {"DepthGreater",            14, {}},
    {"DepthLess",               15, {}},
    {"DepthUnchanged",          16, {}},
    {"LocalSize",               17, {LI, LI, LI}},
    {"LocalSizeHint",           18, {LI, LI, LI}},
    {"InputPoints",             19, {}},
    {"InputLines",              20, {}},
    {"InputLinesAdjacency",     21, {}},
    {"Triangles",               22, {}},
    {"InputTrianglesAdjacency", 23, {}},
    {"Quads",                   24, {}},
    {"Isolines",                25, {}},
    {"OutputVertices",          26, {LI}},
    {"OutputPoints",            27, {}},
    {"OutputLineStrip",         28, {}},
    {"OutputTriangleStrip",     29, {}},
    {"VecTypeHint",             30, {LI}},
    {"ContractionOff",          31, {}},
    {"Initializer",             33, {}},
    {"Finalizer",               34, {}},
    {"SubgroupSize",            35, {LI}},
    {"SubgroupsPerWorkgroup",   36, {LI}},
    {"SubgroupsPerWorkgroupId", 37, {ID}},
    {"LocalSizeId",             38, {ID, ID, ID}},
    {"LocalSizeHintId",         39, {ID, ID, ID}},
  }));
  ks.push_back(value_enum(K::StorageClass, "StorageClass", {
    {"UniformConstant",  0, {}},
    {"Input",            1, {}},
    {"Uniform",          2, {}},
    {"Output",           3, {}},
    {"Workgroup",        4, {}},
    {"CrossWorkgroup",   5, {}},
    {"Private",          6, {}},
    {"Function",         7, {}},
    {"Generic",          8, {}},
    {"PushConstant",     9, {}},
    {"AtomicCounter",   10, {}},
    {"Image",           11, {}},
    {"StorageBuffer",   12, {}},
  }));
  ks.push_back(value_enum(K::Dim, "Dim", {
    {"1D",          0, {}},
    {"2D",          1, {}},
    {"3D",          2, {}},
    {"Cube",        3, {}},
    {"Rect",        4, {}},
    {"Buffer",      5, {}},
    {"SubpassData", 6, {}},
  }));
  ks.push_back(value_enum(K::SamplerAddressingMode, "SamplerAddressingMode", {
    {"None",           0, {}},
    {"ClampToEdge",    1, {}},
    {"Clamp",          2, {}},
    {"Repeat",         3, {}},
    {"RepeatMirrored", 4, {}},
  }));
  ks.push_back(value_enum(K::SamplerFilterMode, "SamplerFilterMode", {
    {"Nearest", 0, {}},
    {"Linear",  1, {}},
  }));
  ks.push_back(value_enum(K::ImageFormat, "ImageFormat", {
    {"Unknown",       0, {}},
    {"Rgba32f",       1, {}},
    {"Rgba16f",       2, {}},
    {"R32f",          3, {}},
    {"Rgba8",         4, {}},
    {"Rgba8Snorm",    5, {}},
    {"Rg32f",         6, {}},
    {"Rg16f",         7, {}},
    {"R11fG11fB10f",  8, {}},
    {"R16f",          9, {}},
    {"Rgba16",       10, {}},
    {"Rgb10A2",      11, {}},
    {"Rg16",         12, {}},
    {"Rg8",          13, {}},
    {"R16",          14, {}},
    {"R8",           15, {}},
    {"Rgba16Snorm",  16, {}},
    {"Rg16Snorm",    17, {}},
    {"Rg8Snorm",     18, {}},
    {"R16Snorm",     19, {}},
    {"R8Snorm",      20, {}},
    {"Rgba32i",      21, {}},
    {"Rgba16i",      22, {}},
    {"Rgba8i",       23, {}},
    {"R32i",         24, {}},
    {"Rg32i",        25, {}},
    {"Rg16i",        26, {}},
    {"Rg8i",         27, {}},
    {"R16i",         28, {}},
    {"R8i",          29, {}},
    {"Rgba32ui",     30, {}},
    {"Rgba16ui",     31, {}},
    {"Rgba8ui",      32, {}},
    {"R32ui",        33, {}},
    {"Rgb10a2ui",    34, {}},
    {"Rg32ui",       35, {}},
    {"Rg16ui",       36, {}},
    {"Rg8ui",        37, {}},
    {"R16ui",        38, {}},
    {"R8ui",         39, {}},
  }));
  ks.push_back(value_enum(K::FPRoundingMode, "FPRoundingMode", {
    {"RTE", 0, {}},
    {"RTZ", 1, {}},
    {"RTP", 2, {}},
    {"RTN", 3, {}},
  }));
  ks.push_back(value_enum(K::LinkageType, "LinkageType", {
    {"Export", 0, {}},
    {"Import", 1, {}},
  }));
  ks.push_back(value_enum(K::AccessQualifier, "AccessQualifier", {
    {"ReadOnly",  0, {}},
    {"WriteOnly", 1, {}},
    {"ReadWrite", 2, {}},
  }));
  ks.push_back(value_enum(
    K::FunctionParameterAttribute, "FunctionParameterAttribute", {
    {"Zext",        0, {}},
    {"Sext",        1, {}},
    {"ByVal",       2, {}},
    {"Sret",        3, {}},
    {"NoAlias",     4, {}},
    {"NoCapture",   5, {}},
    {"NoWrite",     6, {}},
    {"NoReadWrite", 7, {}},
  }));
  ks.push_back(value_enum(K::Decoration, "Decoration", {
    {"RelaxedPrecision",      0, {}},
    {"SpecId",                1, {LI}},
    {"Block",                 2, {}},
    {"BufferBlock",           3, {}},
    {"RowMajor",              4, {}},
    {"ColMajor",              5, {}},
    {"ArrayStride",           6, {LI}},
    {"MatrixStride",          7, {LI}},
    {"GLSLShared",            8, {}},
    {"GLSLPacked",            9, {}},
    {"CPacked",              10, {}},
    {"BuiltIn",              11, {K::BuiltIn}},
    {"NoPerspective",        13, {}},
    {"Flat",                 14, {}},
    {"Patch",                15, {}},
    {"Centroid",             16, {}},
    {"Sample",               17, {}},
    {"Invariant",            18, {}},
    {"Restrict",             19, {}},
    {"Aliased",              20, {}},
    {"Volatile",             21, {}},
    {"Constant",             22, {}},
    {"Coherent",             23, {}},
    {"NonWritable",          24, {}},
    {"NonReadable",          25, {}},
    {"Uniform",              26, {}},
    {"SaturatedConversion",  28, {}},
    {"Stream",               29, {LI}},
    {"Location",             30, {LI}},
    {"Component",            31, {LI}},
    {"Index",                32, {LI}},
    {"Binding",              33, {LI}},
    {"DescriptorSet",        34, {LI}},
    {"Offset",               35, {LI}},
    {"XfbBuffer",            36, {LI}},
    {"XfbStride",            37, {LI}},
    {"FuncParamAttr",        38, {K::FunctionParameterAttribute}},
    {"FPRoundingMode",       39, {K::FPRoundingMode}},
    {"FPFastMathMode",       40, {K::FPFastMathMode}},
    {"LinkageAttributes",    41, {K::LiteralString, K::LinkageType}},
    {"NoContraction",        42, {}},
    {"InputAttachmentIndex", 43, {LI}},
    {"Alignment",            44, {LI}},
    {"MaxByteOffset",        45, {LI}},
    {"AlignmentId",          46, {ID}},
    {"MaxByteOffsetId",      47, {ID}},
    {"NoSignedWrap",       4469, {}},
    {"NoUnsignedWrap",     4470, {}},
    {"CounterBuffer",      5634, {ID}},
    {"UserSemantic",       5635, {K::LiteralString}},
    {"UserTypeGOOGLE",     5636, {K::LiteralString}},
  }));
  ks.push_back(value_enum(K::BuiltIn, "BuiltIn", {
    {"Position",                   0, {}},
    {"PointSize",                  1, {}},
    {"ClipDistance",               3, {}},
    {"CullDistance",               4, {}},
    {"VertexId",                   5, {}},
    {"InstanceId",                 6, {}},
    {"PrimitiveId",                7, {}},
    {"InvocationId",               8, {}},
    {"Layer",                      9, {}},
    {"ViewportIndex",             10, {}},
    {"TessLevelOuter",            11, {}},
    {"TessLevelInner",            12, {}},
    {"TessCoord",                 13, {}},
    {"PatchVertices",             14, {}},
    {"FragCoord",                 15, {}},
    {"PointCoord",                16, {}},
    {"FrontFacing",               17, {}},
    {"SampleId",                  18, {}},
    {"SamplePosition",            19, {}},
    {"SampleMask",                20, {}},
    {"FragDepth",                 22, {}},
    {"HelperInvocation",          23, {}},
    {"NumWorkgroups",             24, {}},
    {"WorkgroupSize",             25, {}},
    {"WorkgroupId",               26, {}},
    {"LocalInvocationId",         27, {}},
    {"GlobalInvocationId",        28, {}},
    {"LocalInvocationIndex",      29, {}},
    {"WorkDim",                   30, {}},
    {"GlobalSize",                31, {}},
    {"EnqueuedWorkgroupSize",     32, {}},
    {"GlobalOffset",              33, {}},
    {"GlobalLinearId",            34, {}},
    {"SubgroupSize",              36, {}},
    {"SubgroupMaxSize",           37, {}},
    {"NumSubgroups",              38, {}},
    {"NumEnqueuedSubgroups",      39, {}},
    {"SubgroupId",                40, {}},
    {"SubgroupLocalInvocationId", 41, {}},
    {"VertexIndex",               42, {}},
    {"InstanceIndex",             43, {}},
  }));
  ks.push_back(value_enum(K::Capability, "Capability", {
    {"Matrix",                              0, {}},
    {"Shader",                              1, {}},
    {"Geometry",                            2, {}},
    {"Tessellation",                        3, {}},
    {"Addresses",                           4, {}},
    {"Linkage",                             5, {}},
    {"Kernel",                              6, {}},
    {"Vector16",                            7, {}},
    {"Float16Buffer",                       8, {}},
    {"Float16",                             9, {}},
    {"Float64",                            10, {}},
    {"Int64",                              11, {}},
    {"Int64Atomics",                       12, {}},
    {"ImageBasic",                         13, {}},
    {"ImageReadWrite",                     14, {}},
    {"ImageMipmap",                        15, {}},
    {"Pipes",                              17, {}},
    {"Groups",                             18, {}},
    {"DeviceEnqueue",                      19, {}},
    {"LiteralSampler",                     20, {}},
    {"AtomicStorage",                      21, {}},
    {"Int16",                              22, {}},
    {"TessellationPointSize",              23, {}},
    {"GeometryPointSize",                  24, {}},
    {"ImageGatherExtended",                25, {}},
    {"StorageImageMultisample",            27, {}},
    {"UniformBufferArrayDynamicIndexing",  28, {}},
    {"SampledImageArrayDynamicIndexing",   29, {}},
    {"StorageBufferArrayDynamicIndexing",  30, {}},
    {"StorageImageArrayDynamicIndexing",   31, {}},
    {"ClipDistance",                       32, {}},
    {"CullDistance",                       33, {}},
    {"ImageCubeArray",                     34, {}},
    {"SampleRateShading",                  35, {}},
    {"ImageRect",                          36, {}},
    {"SampledRect",                        37, {}},
    {"GenericPointer",                     38, {}},
    {"Int8",                               39, {}},
    {"InputAttachment",                    40, {}},
    {"SparseResidency",                    41, {}},
    {"MinLod",                             42, {}},
    {"Sampled1D",                          43, {}},
    {"Image1D",                            44, {}},
    {"SampledCubeArray",                   45, {}},
    {"SampledBuffer",                      46, {}},
    {"ImageBuffer",                        47, {}},
    {"ImageMSArray",                       48, {}},
    {"StorageImageExtendedFormats",        49, {}},
    {"ImageQuery",                         50, {}},
    {"DerivativeControl",                  51, {}},
    {"InterpolationFunction",              52, {}},
    {"TransformFeedback",                  53, {}},
    {"GeometryStreams",                    54, {}},
    {"StorageImageReadWithoutFormat",      55, {}},
    {"StorageImageWriteWithoutFormat",     56, {}},
    {"MultiViewport",                      57, {}},
    {"SubgroupDispatch",                   58, {}},
    {"NamedBarrier",                       59, {}},
    {"PipeStorage",                        60, {}},
  }));
  return ks;
}

const std::vector<operand_kind_info> &spvbin::all_operand_kinds()
{
  static const std::vector<operand_kind_info> kinds = build_operand_kinds();
  return kinds;
}

const operand_kind_info &spvbin::lookup_operand_kind(operand_kind k)
{
  static const std::map<operand_kind,const operand_kind_info *> index = [] {
    std::map<operand_kind,const operand_kind_info *> m;
    for (const auto &oki : all_operand_kinds())
      m[oki.kind] = &oki;
    return m;
  }();
  auto itr = index.find(k);
  if (itr == index.end()) {
    // every enumerator has a table entry; reaching here means the two
    // drifted apart
    throw std::logic_error(
      text::format("INTERNAL ERROR: operand kind ", (int)k, " has no table entry"));
  }
  return *itr->second;
}

const char *spvbin::operand_kind_name(operand_kind k)
{
  return lookup_operand_kind(k).name;
}

const enumerant *spvbin::find_enumerant(
  const operand_kind_info &oki, uint32_t value)
{
  for (const auto &e : oki.enumerants) {
    if (e.value == value)
      return &e;
  }
  return nullptr;
}

std::string spvbin::format_enumerant(
  const operand_kind_info &oki, uint32_t value)
{
  std::stringstream ss;
  if (oki.category == operand_category::BIT_ENUM) {
    text::bitset_mappings mappings;
    for (const auto &e : oki.enumerants)
      mappings.emplace_back(e.value, e.symbol);
    text::expand_bitset_to(ss, value, mappings);
  } else if (const enumerant *e = find_enumerant(oki, value)) {
    ss << e->symbol;
  } else {
    ss << "0x" << text::hex(value, 0);
  }
  return ss.str();
}
