#ifndef SPVBIN_STATS_HPP
#define SPVBIN_STATS_HPP

#include "ir/module.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <vector>

namespace spvbin
{
  // running statistics over a stream of samples
  class stream_sampler {
    uint64_t m_samples;
    double m, s;
    double m_min, m_max, m_sum;

  public:
    stream_sampler() {reset();}

    void reset() {
      m_samples = 0;
      s = m = 0;
      m_min = m_max = 0;
      m_sum = 0;
    }

    void add(double x) {
      // Knuth TAOCP 2, sec 4.2.2.
      if (m_samples == 0) {
        m = x;
        s = 0.0;
        m_min = m_max = x;
      } else {
        double new_mean = m + (x - m) / (m_samples + 1);
        s = s + (x - m) * (x - new_mean);
        m = new_mean;
        m_max = std::max(m_max, x);
        m_min = std::min(m_min, x);
      }
      m_sum += x;
      m_samples++;
    }

    uint64_t size() const {return m_samples;}
    double sum() const {return m_sum;}
    double avg() const {
      return m_samples == 0 ? std::numeric_limits<double>::quiet_NaN() : m;
    }
    double var() const {return m_samples == 0 ? 0.0 : s / m_samples;} // biased
    double stdev() const {return std::sqrt(var());}
    double min() const {return m_min;}
    double max() const {return m_max;}
  }; // stream_sampler

  ///////////////////////////////////////////////////////////////////////////
  // per-opcode usage in a loaded module
  struct opcode_stats {
    uint16_t        opcode = 0;
    uint64_t        count = 0;
    stream_sampler  operands; // concrete operands (ids/results excluded)
  }; // opcode_stats

  struct module_stats {
    uint64_t                           total_words = 0;
    uint64_t                           functions = 0;
    uint64_t                           blocks = 0;
    stream_sampler                     operands;
    std::map<uint16_t,opcode_stats>    by_opcode;

    module_stats() { }
    module_stats(const module &m, uint64_t file_bytes) {
      total_words = file_bytes / sizeof(uint32_t);
      functions = m.functions.size();
      for (const auto &f : m.functions)
        blocks += f.blocks.size();
      for (const auto &i : m.instructions)
        add(i);
    }

    void add(const instruction &i) {
      auto &os = by_opcode[i.opcode];
      os.opcode = i.opcode;
      os.count++;
      os.operands.add((double)i.operands.size());
      operands.add((double)i.operands.size());
    }

    uint64_t instructions() const {return operands.size();}

    // most frequent first (opcode breaks ties)
    std::vector<const opcode_stats *> sorted() const {
      std::vector<const opcode_stats *> ss;
      for (const auto &e : by_opcode)
        ss.push_back(&e.second);
      std::stable_sort(ss.begin(), ss.end(),
        [](const opcode_stats *a, const opcode_stats *b) {
          return a->count > b->count;
        });
      return ss;
    }
  }; // module_stats
} // namespace spvbin

#endif
