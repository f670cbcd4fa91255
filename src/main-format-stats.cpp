#include <iostream>
#include <string>

#include "grammar/grammar_table.hpp"
#include "spvbin_opts.hpp"
#include "stats.hpp"
#include "system.hpp"
#include "text.hpp"

void emit_stats(
  const spvbin::opts &os,
  const std::string &file,
  const spvbin::module_stats &ms)
{
  std::cout << "============== " << sys::take_file(file) << "\n";
  std::cout << "  " << text::coll("words:", 16) <<
    text::colr(ms.total_words, 8) << "\n";
  std::cout << "  " << text::coll("instructions:", 16) <<
    text::colr(ms.instructions(), 8) << "\n";
  std::cout << "  " << text::coll("functions:", 16) <<
    text::colr(ms.functions, 8) << " (" << ms.blocks << " blocks)\n";
  if (ms.instructions() == 0)
    return;

  text::table t;
  auto &c_op = t.define_col("opcode", false);
  auto &c_num = t.define_col("id");
  auto &c_cnt = t.define_col("count");
  auto &c_pct = t.define_col("%");
  auto &c_avg = t.define_col("opnds.avg");
  auto &c_max = t.define_col("opnds.max");

  for (const spvbin::opcode_stats *s : ms.sorted()) {
    c_op.emit(spvbin::opcode_name(s->opcode));
    c_num.emit(s->opcode);
    c_cnt.emit(s->count);
    c_pct.emit(100.0 * s->count / ms.instructions(), 1);
    c_avg.emit(s->operands.avg(), 2);
    c_max.emit((uint64_t)s->operands.max());
  }
  t.str(std::cout);

  if (os.verbose_enabled()) {
    std::cout << "  operands per instruction: avg " <<
      text::format(ms.operands.avg()) << ", stdev " <<
      text::format(ms.operands.stdev()) << ", max " <<
      (uint64_t)ms.operands.max() << "\n";
  }
}
