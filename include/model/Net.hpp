#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace nettui::model {

// One socket as reported by the host, before normalization.
struct RawConnection {
  uint32_t type{};       // transport code: 1 stream (tcp), 2 datagram (udp)
  uint32_t family{};     // address family: 2 AF_INET, 10 AF_INET6
  std::string local_ip;
  uint32_t local_port{};
  std::string remote_ip;
  uint32_t remote_port{};
  std::string status;    // e.g. "LISTEN"; empty when the host gave no usable state
  int32_t pid{};         // 0 when the owner is not visible
};

struct RawInterface {
  std::string name;
  bool up{false};
  bool loopback{false};
  std::vector<std::string> addrs; // "address/prefixlen"
};

// Cumulative byte totals since the interface came up.
struct RawIoCounter {
  std::string name;
  uint64_t rx_bytes{};
  uint64_t tx_bytes{};
};

} // namespace nettui::model
