#include "app/Cli.hpp"
#include <algorithm>
#include <optional>

namespace nettui::app {

static std::optional<ui::Tab> parse_tab(const std::string& s) {
  if (s == "connections") return ui::Tab::Connections;
  if (s == "ports") return ui::Tab::Ports;
  if (s == "interfaces") return ui::Tab::Interfaces;
  return std::nullopt;
}

bool parse_args(const std::vector<std::string>& args, ui::Config& cfg, CliOptions& opts, std::string& error) {
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    const bool takes_value = (a == "--interval-ms" || a == "--tab");
    if (takes_value && i + 1 >= args.size()) {
      error = "missing value for " + a;
      return false;
    }
    if (a == "--interval-ms") {
      const std::string& v = args[++i];
      size_t used = 0;
      int ms = 0;
      try { ms = std::stoi(v, &used); } catch (const std::exception&) { used = 0; }
      if (used == 0 || used != v.size()) {
        error = "invalid --interval-ms value '" + v + "'";
        return false;
      }
      cfg.interval_ms = std::clamp(ms, 250, 60000);
    } else if (a == "--tab") {
      auto t = parse_tab(args[++i]);
      if (!t) {
        error = "unknown tab '" + args[i] + "'";
        return false;
      }
      opts.tab = *t;
    } else if (a == "--once") {
      opts.once = true;
    } else if (a == "-h" || a == "--help") {
      opts.help = true;
      return true;
    } else {
      error = "unrecognized argument '" + a + "'";
      return false;
    }
  }
  return true;
}

} // namespace nettui::app
