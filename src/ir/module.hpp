#ifndef SPVBIN_IR_MODULE_HPP
#define SPVBIN_IR_MODULE_HPP

#include "../grammar/operand_kinds.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace spvbin
{
  ///////////////////////////////////////////////////////////////////////////
  // The five words that open every module.
  struct module_header {
    uint32_t magic = 0;
    uint32_t version = 0;   // 0x00MMmm00
    uint32_t generator = 0; // tool id << 16 | tool version
    uint32_t bound = 0;     // all ids are < bound
    uint32_t reserved = 0;  // a.k.a. schema

    module_header() { }
    module_header(
      uint32_t _magic,
      uint32_t _version,
      uint32_t _generator,
      uint32_t _bound,
      uint32_t _reserved)
      : magic(_magic), version(_version), generator(_generator)
      , bound(_bound), reserved(_reserved) { }

    uint32_t major_version() const {return (version >> 16) & 0xFF;}
    uint32_t minor_version() const {return (version >> 8) & 0xFF;}
    uint32_t generator_tool() const {return generator >> 16;}
    uint32_t generator_version() const {return generator & 0xFFFF;}

    std::string str() const;

    bool operator==(const module_header &h) const {
      return magic == h.magic && version == h.version &&
        generator == h.generator && bound == h.bound &&
        reserved == h.reserved;
    }
    bool operator!=(const module_header &h) const {return !(*this == h);}
  }; // module_header

  ///////////////////////////////////////////////////////////////////////////
  // operand values
  struct id_ref {
    uint32_t id;
    bool operator==(const id_ref &i) const {return id == i.id;}
  };
  struct literal_number {
    uint64_t value;
    uint32_t words; // 1 or 2
    bool operator==(const literal_number &l) const {
      return value == l.value && words == l.words;
    }
  };
  struct literal_string {
    std::string value;
    bool operator==(const literal_string &l) const {return value == l.value;}
  };
  struct enumerant_value {
    uint32_t value;
    bool operator==(const enumerant_value &e) const {return value == e.value;}
  };

  // One decoded operand; kind says how to interpret the value.
  struct operand {
    operand_kind kind;
    std::variant<
        id_ref
      , literal_number
      , literal_string
      , enumerant_value>   var;

    operand(operand_kind k, id_ref v) : kind(k), var(v) { }
    operand(operand_kind k, literal_number v) : kind(k), var(v) { }
    operand(operand_kind k, literal_string v) : kind(k), var(std::move(v)) { }
    operand(operand_kind k, enumerant_value v) : kind(k), var(v) { }

    static operand id(operand_kind k, uint32_t i) {
      return operand(k, id_ref{i});
    }
    static operand number32(operand_kind k, uint32_t v) {
      return operand(k, literal_number{v, 1});
    }
    static operand number64(operand_kind k, uint64_t v) {
      return operand(k, literal_number{v, 2});
    }
    static operand string(operand_kind k, std::string s) {
      return operand(k, literal_string{std::move(s)});
    }
    static operand enum_value(operand_kind k, uint32_t v) {
      return operand(k, enumerant_value{v});
    }

    template <typename T>
    bool is() const noexcept {return std::holds_alternative<T>(var);}
    template <typename T>
    const T &as() const {return std::get<T>(var);}

    // "%12", "42", "\"main\"", "Kernel", "Inline|Const"
    std::string str() const;

    bool operator==(const operand &o) const {
      return kind == o.kind && var == o.var;
    }
    bool operator!=(const operand &o) const {return !(*this == o);}
  }; // operand

  ///////////////////////////////////////////////////////////////////////////
  struct instruction {
    uint16_t                  opcode = 0;
    std::optional<uint32_t>   result_type;
    std::optional<uint32_t>   result_id;
    std::vector<operand>      operands;

    instruction() { }
    explicit instruction(uint16_t op) : opcode(op) { }

    const char *opname() const;

    // e.g. "%5 = OpTypeInt 32 1" or "%9 = OpLoad %5 %8 Aligned 4"
    void str(std::ostream &os) const;
    std::string str() const;

    bool operator==(const instruction &i) const {
      return opcode == i.opcode && result_type == i.result_type &&
        result_id == i.result_id && operands == i.operands;
    }
    bool operator!=(const instruction &i) const {return !(*this == i);}
  }; // instruction

  ///////////////////////////////////////////////////////////////////////////
  // logical layout (as assembled by module_loader)
  struct basic_block {
    std::optional<instruction>    label;
    std::vector<instruction>      body;
  };

  struct function {
    std::optional<instruction>    def;
    std::vector<instruction>      parameters;
    std::vector<basic_block>      blocks;
    std::optional<instruction>    end;

    std::optional<uint32_t> id() const {
      return def ? def->result_id : std::nullopt;
    }
  };

  struct module {
    std::optional<module_header>  header;

    // every instruction in stream order
    std::vector<instruction>      instructions;

    std::vector<instruction>      capabilities;
    std::vector<instruction>      extensions;
    std::vector<instruction>      ext_inst_imports;
    std::optional<instruction>    memory_model;
    std::vector<instruction>      entry_points;
    std::vector<instruction>      execution_modes;
    std::vector<instruction>      debugs;
    std::vector<instruction>      annotations;
    std::vector<instruction>      types_global_values;
    std::vector<function>         functions;

    // a multi-line listing grouped by section
    void str(std::ostream &os) const;
    std::string str() const;
  }; // module
} // namespace spvbin

#endif
