#pragma once
#include <string>
#include <vector>
#include "model/Net.hpp"

struct sockaddr;

namespace nettui::collectors {

// Host interfaces and their bound addresses via getifaddrs(3).
class InterfaceCollector {
public:
  bool sample(std::vector<model::RawInterface>& out);

  // Number of leading one bits in a netmask (IPv4 or IPv6).
  static int prefix_len(const sockaddr* mask);
};

} // namespace nettui::collectors
