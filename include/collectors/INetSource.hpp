#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "model/Net.hpp"

namespace nettui::collectors {

// Host network capability consumed by one normalization pass. Each call may
// fail independently; a failure only empties its own category.
class INetSource {
public:
  virtual ~INetSource() = default;

  // All TCP/UDP sockets over IPv4 and IPv6. Return false if enumeration failed.
  [[nodiscard]] virtual bool connections(std::vector<model::RawConnection>& out) = 0;

  // Display name of a process. Empty optional when not permitted or gone.
  [[nodiscard]] virtual std::optional<std::string> process_name(int32_t pid) = 0;

  [[nodiscard]] virtual bool interfaces(std::vector<model::RawInterface>& out) = 0;

  // Per-interface cumulative byte counters.
  [[nodiscard]] virtual bool io_counters(std::vector<model::RawIoCounter>& out) = 0;

  // Optional: human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace nettui::collectors
