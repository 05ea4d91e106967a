#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include "collectors/INetSource.hpp"
#include "model/Snapshot.hpp"

namespace nettui::app {

// Pid -> process name lookups for one pass. Failed lookups are remembered as
// the empty name so a pid is queried at most once per pass.
class ProcessNameCache {
public:
  explicit ProcessNameCache(collectors::INetSource& src) : src_(src) {}
  const std::string& lookup(int32_t pid);
  [[nodiscard]] size_t size() const { return names_.size(); }
private:
  collectors::INetSource& src_;
  std::unordered_map<int32_t, std::string> names_;
};

// "tcp", "udp", "tcp6" or "udp6" from the raw transport and family codes
[[nodiscard]] std::string proto_label(uint32_t type, uint32_t family);
// "addr:port", with "*" standing in for an empty address
[[nodiscard]] std::string format_endpoint(const std::string& ip, uint32_t port);
// Empty, 0.0.0.0 and :: all mean "any"
[[nodiscard]] bool wildcard_addr(const std::string& ip);

std::vector<model::ConnectionRecord> build_connections(const std::vector<model::RawConnection>& raw,
                                                       ProcessNameCache& names);
std::vector<model::PortRecord> build_ports(const std::vector<model::RawConnection>& raw,
                                           ProcessNameCache& names);
std::vector<model::InterfaceRecord> build_interfaces(const std::vector<model::RawInterface>& ifs,
                                                     const std::vector<model::RawIoCounter>& counters);

// One normalization pass. Acquisition failures empty only their own category.
// The returned snapshot has seq 0; the poller stamps it.
[[nodiscard]] model::Snapshot normalize(collectors::INetSource& src);

} // namespace nettui::app
