#include "app/Normalizer.hpp"
#include <algorithm>
#include <cstdio>
#include <set>
#include <utility>
#include "ui/Config.hpp"

namespace nettui::app {

namespace {
constexpr uint32_t kSockDgram = 2;
constexpr uint32_t kFamilyInet6 = 10;
constexpr uint32_t kFamilyInet6Alt = 23;
}

const std::string& ProcessNameCache::lookup(int32_t pid) {
  auto it = names_.find(pid);
  if (it != names_.end()) return it->second;
  auto name = src_.process_name(pid);
  return names_.emplace(pid, name.value_or(std::string{})).first->second;
}

std::string proto_label(uint32_t type, uint32_t family) {
  std::string label = (type == kSockDgram) ? "udp" : "tcp";
  if (family == kFamilyInet6 || family == kFamilyInet6Alt) label += '6';
  return label;
}

std::string format_endpoint(const std::string& ip, uint32_t port) {
  return (ip.empty() ? std::string("*") : ip) + ":" + std::to_string(port);
}

bool wildcard_addr(const std::string& ip) {
  return ip.empty() || ip == "0.0.0.0" || ip == "::";
}

std::vector<model::ConnectionRecord> build_connections(const std::vector<model::RawConnection>& raw,
                                                       ProcessNameCache& names) {
  std::vector<model::ConnectionRecord> out;
  out.reserve(raw.size());
  for (const auto& c : raw) {
    if (c.status.empty()) continue;
    model::ConnectionRecord r;
    r.proto = proto_label(c.type, c.family);
    r.local = format_endpoint(c.local_ip, c.local_port);
    r.remote = format_endpoint(c.remote_ip, c.remote_port);
    r.state = c.status;
    r.pid = c.pid;
    if (c.pid > 0) r.process = names.lookup(c.pid);
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<model::PortRecord> build_ports(const std::vector<model::RawConnection>& raw,
                                           ProcessNameCache& names) {
  std::vector<model::PortRecord> out;
  std::set<std::pair<uint32_t, std::string>> seen;
  for (const auto& c : raw) {
    if (c.status != "LISTEN") continue;
    std::string proto = proto_label(c.type, c.family);
    if (!seen.emplace(c.local_port, proto).second) continue;
    model::PortRecord p;
    p.port = c.local_port;
    p.proto = std::move(proto);
    p.addr = wildcard_addr(c.local_ip) ? std::string("*") : c.local_ip;
    p.pid = c.pid;
    if (c.pid > 0) p.process = names.lookup(c.pid);
    out.push_back(std::move(p));
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const model::PortRecord& a, const model::PortRecord& b){ return a.port < b.port; });
  return out;
}

std::vector<model::InterfaceRecord> build_interfaces(const std::vector<model::RawInterface>& ifs,
                                                     const std::vector<model::RawIoCounter>& counters) {
  std::unordered_map<std::string, const model::RawIoCounter*> by_name;
  for (const auto& k : counters) by_name.emplace(k.name, &k);
  std::vector<model::InterfaceRecord> out;
  for (const auto& i : ifs) {
    if (i.loopback) continue;
    model::InterfaceRecord r;
    r.name = i.name;
    r.up = i.up;
    r.addrs = i.addrs;
    if (auto it = by_name.find(i.name); it != by_name.end()) {
      r.rx_bytes = it->second->rx_bytes;
      r.tx_bytes = it->second->tx_bytes;
    }
    out.push_back(std::move(r));
  }
  return out;
}

model::Snapshot normalize(collectors::INetSource& src) {
  model::Snapshot snap;
  ProcessNameCache names(src);

  std::vector<model::RawConnection> conns;
  const bool conns_ok = src.connections(conns);
  if (!conns_ok) conns.clear();
  snap.connections = build_connections(conns, names);
  snap.ports = build_ports(conns, names);

  std::vector<model::RawInterface> ifs;
  const bool ifs_ok = src.interfaces(ifs);
  if (!ifs_ok) ifs.clear();
  std::vector<model::RawIoCounter> counters;
  const bool io_ok = src.io_counters(counters);
  if (!io_ok) counters.clear();
  snap.interfaces = build_interfaces(ifs, counters);

  if (ui::debug_enabled()) {
    std::fprintf(stderr, "nettui: pass via %s: %zu connections%s, %zu ports, %zu interfaces%s%s, %zu names resolved\n",
                 src.name(), snap.connections.size(), conns_ok ? "" : " (source failed)",
                 snap.ports.size(), snap.interfaces.size(),
                 ifs_ok ? "" : " (source failed)", io_ok ? "" : " (counters failed)", names.size());
  }
  return snap;
}

} // namespace nettui::app
