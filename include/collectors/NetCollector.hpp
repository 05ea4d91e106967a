#pragma once
#include <vector>
#include "model/Net.hpp"

namespace nettui::collectors {

// Cumulative per-interface byte counters from /proc/net/dev.
class NetCollector {
public:
  bool sample(std::vector<model::RawIoCounter>& out);
};

} // namespace nettui::collectors
