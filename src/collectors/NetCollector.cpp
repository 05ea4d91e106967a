#include "collectors/NetCollector.hpp"
#include "util/Procfs.hpp"
#include <sstream>

namespace nettui::collectors {

bool NetCollector::sample(std::vector<model::RawIoCounter>& out) {
  auto txt_opt = util::read_file_string("/proc/net/dev");
  if (!txt_opt) return false;
  out.clear();
  std::istringstream ss(*txt_opt);
  std::string line; int line_no = 0;
  while (std::getline(ss, line)) {
    ++line_no; if (line_no <= 2) continue; // headers
    // format: iface: rx_bytes ... tx_bytes ...
    auto colon = line.find(':'); if (colon == std::string::npos) continue;
    std::string name = line.substr(0, colon);
    while (!name.empty() && name.front() == ' ') name.erase(name.begin());
    if (name.empty()) continue;
    std::istringstream ns(line.substr(colon+1));
    uint64_t rx_bytes=0, tx_bytes=0; // positions: 1st and 9th numbers
    ns >> rx_bytes;
    for (int i=0;i<7;i++){ uint64_t tmp; ns >> tmp; }
    ns >> tx_bytes;
    if (!ns) continue;
    out.push_back(model::RawIoCounter{name, rx_bytes, tx_bytes});
  }
  return true;
}

} // namespace nettui::collectors
