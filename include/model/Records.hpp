#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace nettui::model {

struct ConnectionRecord {
  std::string proto;   // tcp, udp, tcp6, udp6
  std::string local;   // address:port, "*" for an empty address
  std::string remote;
  std::string state;
  int32_t pid{};
  std::string process; // may be empty
};

struct PortRecord {
  uint32_t port{};
  std::string proto;
  std::string addr;    // "*" for any wildcard bind
  int32_t pid{};
  std::string process;
};

struct InterfaceRecord {
  std::string name;
  bool up{false};
  std::vector<std::string> addrs;
  uint64_t rx_bytes{}; // cumulative
  uint64_t tx_bytes{}; // cumulative
};

} // namespace nettui::model
