#pragma once
#include <cstdint>
#include <vector>
#include "model/Records.hpp"

namespace nettui::model {

// Result of one poll pass. Moved, never shared, from the poller to the navigator.
struct Snapshot {
  uint64_t seq{};
  std::vector<ConnectionRecord> connections;
  std::vector<PortRecord> ports;
  std::vector<InterfaceRecord> interfaces;
};

} // namespace nettui::model
