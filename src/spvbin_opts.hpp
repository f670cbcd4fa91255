#ifndef SPVBIN_OPTS_STRUCT_HPP
#define SPVBIN_OPTS_STRUCT_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace spvbin
{
struct opts {
  std::vector<std::string>    input_files; // regular arg
  bool                        dump_module = false; // -d
  size_t                      max_instructions = 0; // -n (0 means all)
  bool                        show_stats = false; // -s
  int                         verbosity = 0;

  opts() = default;

  bool debug_enabled() const {return verbosity >= 2;}
  bool verbose_enabled() const {return verbosity >= 1;}
  bool quiet() const {return verbosity < 0;}
};

} // namespace spvbin

#endif
