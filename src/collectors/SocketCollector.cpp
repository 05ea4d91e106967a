#include "collectors/SocketCollector.hpp"
#include "util/Procfs.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cctype>
#include <charconv>
#include <cstring>
#include <sstream>

namespace nettui::collectors {

namespace {

struct SocketTable { const char* path; uint32_t type; uint32_t family; };

constexpr SocketTable kTables[] = {
  {"/proc/net/tcp",  SOCK_STREAM, AF_INET},
  {"/proc/net/tcp6", SOCK_STREAM, AF_INET6},
  {"/proc/net/udp",  SOCK_DGRAM,  AF_INET},
  {"/proc/net/udp6", SOCK_DGRAM,  AF_INET6},
};

bool parse_hex32(std::string_view hex, uint32_t& out) {
  if (hex.empty()) return false;
  auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), out, 16);
  return ec == std::errc() && ptr == hex.data() + hex.size();
}

// "0100007F:0035" -> address hex + port
bool split_endpoint(std::string_view ep, uint32_t family, std::string& ip, uint32_t& port) {
  auto colon = ep.find(':');
  if (colon == std::string_view::npos) return false;
  if (!parse_hex32(ep.substr(colon + 1), port)) return false;
  ip = SocketCollector::decode_addr(ep.substr(0, colon), family);
  return !ip.empty();
}

bool all_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  return true;
}

} // namespace

const char* SocketCollector::tcp_state_name(unsigned code) {
  switch (code) {
    case 0x01: return "ESTABLISHED";
    case 0x02: return "SYN_SENT";
    case 0x03: return "SYN_RECV";
    case 0x04: return "FIN_WAIT1";
    case 0x05: return "FIN_WAIT2";
    case 0x06: return "TIME_WAIT";
    case 0x07: return "CLOSE";
    case 0x08: return "CLOSE_WAIT";
    case 0x09: return "LAST_ACK";
    case 0x0A: return "LISTEN";
    case 0x0B: return "CLOSING";
    default: return "";
  }
}

std::string SocketCollector::decode_addr(std::string_view hex, uint32_t family) {
  // The kernel prints each 32-bit word of the network-order address as a
  // host-order integer, so copying the parsed word back restores the bytes.
  if (family == AF_INET) {
    uint32_t w = 0;
    if (hex.size() != 8 || !parse_hex32(hex, w)) return {};
    in_addr a{};
    std::memcpy(&a, &w, sizeof(w));
    char buf[INET_ADDRSTRLEN];
    if (!::inet_ntop(AF_INET, &a, buf, sizeof(buf))) return {};
    return buf;
  }
  if (family == AF_INET6) {
    if (hex.size() != 32) return {};
    in6_addr a{};
    auto* bytes = reinterpret_cast<unsigned char*>(&a);
    for (int i = 0; i < 4; ++i) {
      uint32_t w = 0;
      if (!parse_hex32(hex.substr(static_cast<size_t>(i) * 8, 8), w)) return {};
      std::memcpy(bytes + i * 4, &w, sizeof(w));
    }
    char buf[INET6_ADDRSTRLEN];
    if (!::inet_ntop(AF_INET6, &a, buf, sizeof(buf))) return {};
    return buf;
  }
  return {};
}

bool SocketCollector::parse_line(const std::string& line, uint32_t type, uint32_t family,
                                 model::RawConnection& out, uint64_t& inode) {
  // sl local_address rem_address st tx:rx tr:when retrnsmt uid timeout inode ...
  std::istringstream ss(line);
  std::string sl, local, remote, st, queues, timer, retrnsmt, uid, timeout, inode_s;
  if (!(ss >> sl >> local >> remote >> st >> queues >> timer >> retrnsmt >> uid >> timeout >> inode_s))
    return false;
  if (sl.empty() || sl.back() != ':') return false; // header row starts with "sl"

  model::RawConnection c;
  c.type = type;
  c.family = family;
  if (!split_endpoint(local, family, c.local_ip, c.local_port)) return false;
  if (!split_endpoint(remote, family, c.remote_ip, c.remote_port)) return false;

  uint32_t code = 0;
  if (!parse_hex32(st, code)) return false;
  c.status = (type == SOCK_STREAM) ? tcp_state_name(code) : "NONE";

  inode = 0;
  auto [ptr, ec] = std::from_chars(inode_s.data(), inode_s.data() + inode_s.size(), inode);
  if (ec != std::errc()) inode = 0;

  out = std::move(c);
  return true;
}

std::unordered_map<uint64_t, int32_t> SocketCollector::inode_owners() {
  std::unordered_map<uint64_t, int32_t> owners;
  static constexpr std::string_view kPrefix = "socket:[";
  for (const auto& ent : util::list_dir("/proc")) {
    if (!all_digits(ent)) continue;
    int32_t pid = 0;
    auto [p, ec] = std::from_chars(ent.data(), ent.data() + ent.size(), pid);
    if (ec != std::errc() || pid <= 0) continue;
    const std::string fd_dir = "/proc/" + ent + "/fd";
    // Unprivileged scans only see our own processes; the rest keep pid 0.
    for (const auto& fd : util::list_dir(fd_dir)) {
      auto link = util::read_symlink(fd_dir + "/" + fd);
      if (!link || link->rfind(kPrefix, 0) != 0 || link->back() != ']') continue;
      std::string_view num(link->data() + kPrefix.size(), link->size() - kPrefix.size() - 1);
      uint64_t inode = 0;
      auto [q, ec2] = std::from_chars(num.data(), num.data() + num.size(), inode);
      if (ec2 != std::errc() || inode == 0) continue;
      owners.emplace(inode, pid);
    }
  }
  return owners;
}

bool SocketCollector::sample(std::vector<model::RawConnection>& out) {
  out.clear();
  std::vector<std::pair<const SocketTable*, std::string>> tables;
  for (const auto& t : kTables) {
    auto txt = util::read_file_string(t.path);
    if (txt) tables.emplace_back(&t, std::move(*txt));
  }
  if (tables.empty()) return false;

  auto owners = inode_owners();
  for (const auto& [t, txt] : tables) {
    std::istringstream ss(txt);
    std::string line;
    while (std::getline(ss, line)) {
      model::RawConnection c;
      uint64_t inode = 0;
      if (!parse_line(line, t->type, t->family, c, inode)) continue;
      if (inode != 0) {
        auto it = owners.find(inode);
        if (it != owners.end()) c.pid = it->second;
      }
      out.push_back(std::move(c));
    }
  }
  return true;
}

} // namespace nettui::collectors
