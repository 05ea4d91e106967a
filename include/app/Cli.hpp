#pragma once
#include <string>
#include <vector>
#include "ui/Config.hpp"
#include "ui/Navigation.hpp"

namespace nettui::app {

struct CliOptions {
  ui::Tab tab{ui::Tab::Connections};
  bool once{false};
  bool help{false};
};

// Parse argv[1..] on top of `cfg` (already loaded from the environment).
// Returns false with a one-line message in `error` on bad usage.
bool parse_args(const std::vector<std::string>& args, ui::Config& cfg, CliOptions& opts, std::string& error);

} // namespace nettui::app
