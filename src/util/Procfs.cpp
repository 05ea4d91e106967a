#include "util/Procfs.hpp"

#include <sys/types.h>
#include <dirent.h>
#include <unistd.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace nettui::util {

static std::string proc_root() {
  const char* env = std::getenv("NETTUI_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  auto root = proc_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_proc_path(abs));
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  // A process can exit between open and read; the stream then reports bad().
  if (in.bad()) return std::nullopt;
  return s;
}

auto read_symlink(const std::string& abs) -> std::optional<std::string> {
  auto path = map_proc_path(abs);
  char buf[256];
  ssize_t n = ::readlink(path.c_str(), buf, sizeof(buf) - 1);
  if (n <= 0) return std::nullopt;
  return std::string(buf, static_cast<size_t>(n));
}

auto list_dir(const std::string& abs) -> std::vector<std::string> {
  std::vector<std::string> out;
  auto path = map_proc_path(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) return out;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return out;
}

} // namespace nettui::util
