#include "collectors/InterfaceCollector.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <bit>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include "ui/Config.hpp"

namespace nettui::collectors {

int InterfaceCollector::prefix_len(const sockaddr* mask) {
  if (!mask) return -1;
  const unsigned char* bytes = nullptr;
  size_t n = 0;
  if (mask->sa_family == AF_INET) {
    bytes = reinterpret_cast<const unsigned char*>(&reinterpret_cast<const sockaddr_in*>(mask)->sin_addr);
    n = 4;
  } else if (mask->sa_family == AF_INET6) {
    bytes = reinterpret_cast<const unsigned char*>(&reinterpret_cast<const sockaddr_in6*>(mask)->sin6_addr);
    n = 16;
  } else {
    return -1;
  }
  int bits = 0;
  for (size_t i = 0; i < n; ++i) bits += std::popcount(static_cast<unsigned>(bytes[i]));
  return bits;
}

static std::string format_addr(const sockaddr* addr, const sockaddr* mask) {
  char buf[INET6_ADDRSTRLEN];
  const void* src = nullptr;
  if (addr->sa_family == AF_INET) src = &reinterpret_cast<const sockaddr_in*>(addr)->sin_addr;
  else src = &reinterpret_cast<const sockaddr_in6*>(addr)->sin6_addr;
  if (!::inet_ntop(addr->sa_family, src, buf, sizeof(buf))) return {};
  std::string out(buf);
  int plen = InterfaceCollector::prefix_len(mask);
  if (plen >= 0) out += "/" + std::to_string(plen);
  return out;
}

namespace {
// Owns the getifaddrs list for the duration of one sample
class IfAddrList {
  ifaddrs* head_{nullptr};
public:
  int status;
  IfAddrList() { status = ::getifaddrs(&head_); }
  ~IfAddrList() { if (head_) ::freeifaddrs(head_); }
  IfAddrList(const IfAddrList&) = delete;
  IfAddrList& operator=(const IfAddrList&) = delete;
  ifaddrs* head() const { return head_; }
};
} // namespace

bool InterfaceCollector::sample(std::vector<model::RawInterface>& out) {
  IfAddrList list;
  if (list.status != 0) {
    if (ui::debug_enabled())
      std::fprintf(stderr, "nettui: getifaddrs failed: %s\n", std::strerror(errno));
    return false;
  }
  out.clear();
  // getifaddrs yields one entry per (interface, address); fold by name in first-seen order
  for (ifaddrs* it = list.head(); it; it = it->ifa_next) {
    if (!it->ifa_name) continue;
    model::RawInterface* ifc = nullptr;
    for (auto& e : out) if (e.name == it->ifa_name) { ifc = &e; break; }
    if (!ifc) {
      out.push_back(model::RawInterface{});
      ifc = &out.back();
      ifc->name = it->ifa_name;
    }
    ifc->up = (it->ifa_flags & IFF_UP) != 0;
    ifc->loopback = (it->ifa_flags & IFF_LOOPBACK) != 0;
    if (!it->ifa_addr) continue;
    int fam = it->ifa_addr->sa_family;
    if (fam != AF_INET && fam != AF_INET6) continue;
    auto a = format_addr(it->ifa_addr, it->ifa_netmask);
    if (!a.empty()) ifc->addrs.push_back(std::move(a));
  }
  return true;
}

} // namespace nettui::collectors
