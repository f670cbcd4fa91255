#include "module.hpp"
#include "../grammar/grammar_table.hpp"
#include "../text.hpp"

#include <sstream>

using namespace spvbin;

std::string module_header::str() const
{
  std::stringstream ss;
  ss << "magic 0x" << text::hex(magic) <<
    ", version " << major_version() << "." << minor_version() <<
    ", generator 0x" << text::hex(generator) <<
    " (tool " << generator_tool() << " v" << generator_version() << ")" <<
    ", bound " << bound;
  if (reserved != 0)
    ss << ", reserved 0x" << text::hex(reserved);
  return ss.str();
}

std::string operand::str() const
{
  if (is<id_ref>()) {
    return text::format("%", as<id_ref>().id);
  } else if (is<literal_number>()) {
    return text::format(as<literal_number>().value);
  } else if (is<literal_string>()) {
    return text::format('"', as<literal_string>().value, '"');
  } else {
    return format_enumerant(
      lookup_operand_kind(kind), as<enumerant_value>().value);
  }
}

const char *instruction::opname() const
{
  return opcode_name(opcode);
}

void instruction::str(std::ostream &os) const
{
  if (result_id)
    os << "%" << *result_id << " = ";
  os << opname();
  if (result_type)
    os << " %" << *result_type;
  for (const auto &o : operands)
    os << " " << o.str();
}

std::string instruction::str() const
{
  std::stringstream ss;
  str(ss);
  return ss.str();
}

static void emit_section(
  std::ostream &os,
  const char *name,
  const std::vector<instruction> &insts)
{
  if (insts.empty())
    return;
  os << "; " << name << "\n";
  for (const auto &i : insts) {
    os << "  ";
    i.str(os);
    os << "\n";
  }
}

void module::str(std::ostream &os) const
{
  if (header)
    os << "; " << header->str() << "\n";
  emit_section(os, "capabilities", capabilities);
  emit_section(os, "extensions", extensions);
  emit_section(os, "ext_inst_imports", ext_inst_imports);
  if (memory_model) {
    os << "; memory model\n  ";
    memory_model->str(os);
    os << "\n";
  }
  emit_section(os, "entry points", entry_points);
  emit_section(os, "execution modes", execution_modes);
  emit_section(os, "debug", debugs);
  emit_section(os, "annotations", annotations);
  emit_section(os, "types, constants and globals", types_global_values);
  for (const auto &f : functions) {
    os << "; function";
    if (auto id = f.id())
      os << " %" << *id;
    os << "\n";
    if (f.def) {
      os << "  ";
      f.def->str(os);
      os << "\n";
    }
    for (const auto &p : f.parameters) {
      os << "  ";
      p.str(os);
      os << "\n";
    }
    for (const auto &b : f.blocks) {
      if (b.label) {
        os << "  ";
        b.label->str(os);
        os << "\n";
      }
      for (const auto &i : b.body) {
        os << "    ";
        i.str(os);
        os << "\n";
      }
    }
    if (f.end) {
      os << "  ";
      f.end->str(os);
      os << "\n";
    }
  }
}

std::string module::str() const
{
  std::stringstream ss;
  str(ss);
  return ss.str();
}
