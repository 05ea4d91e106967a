#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "model/Net.hpp"

namespace nettui::collectors {

// Socket tables from /proc/net/{tcp,tcp6,udp,udp6}, with owners resolved by
// walking /proc/<pid>/fd for socket:[inode] links.
class SocketCollector {
public:
  // Returns false only when none of the four tables could be read.
  bool sample(std::vector<model::RawConnection>& out);

  // Parse one table row. Header and malformed rows return false.
  static bool parse_line(const std::string& line, uint32_t type, uint32_t family,
                         model::RawConnection& out, uint64_t& inode);
  // Kernel hex address (host-order 32-bit words) to presentation form.
  static std::string decode_addr(std::string_view hex, uint32_t family);
  // TCP state code to label; empty for codes the kernel should never report.
  static const char* tcp_state_name(unsigned code);

private:
  static std::unordered_map<uint64_t, int32_t> inode_owners();
};

} // namespace nettui::collectors
