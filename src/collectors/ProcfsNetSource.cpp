#include "collectors/ProcfsNetSource.hpp"
#include "util/Procfs.hpp"

namespace nettui::collectors {

std::optional<std::string> ProcfsNetSource::process_name(int32_t pid) {
  if (pid <= 0) return std::nullopt;
  auto txt = util::read_file_string("/proc/" + std::to_string(pid) + "/comm");
  if (!txt) return std::nullopt;
  std::string name = *txt;
  while (!name.empty() && (name.back() == '\n' || name.back() == '\r' || name.back() == ' '))
    name.pop_back();
  if (name.empty()) return std::nullopt;
  return name;
}

} // namespace nettui::collectors
