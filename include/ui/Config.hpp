#pragma once

#include <string>

namespace nettui::ui {

// Runtime settings resolved from the environment (no config file)
struct Config {
  int interval_ms{2000};
  bool alt_screen{true};
  bool color{true};
};

// Immutable style table handed to the renderer. Empty strings mean "no styling".
struct Theme {
  bool unicode{false};
  std::string title;
  std::string dim;
  std::string header;
  std::string selected;
  std::string tab_active;
  std::string tab_inactive;
  std::string state_up;
  std::string state_down;
  std::string reset;

  [[nodiscard]] static Theme plain(bool unicode = false) {
    Theme t; t.unicode = unicode; return t;
  }
};

// Environment variable helpers
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool env_flag(const char* name, bool defv);
bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b);

// NETTUI_DEBUG: per-pass diagnostics on stderr
[[nodiscard]] bool debug_enabled();

[[nodiscard]] Config load_config();
[[nodiscard]] Theme make_theme(const Config& cfg);

} // namespace nettui::ui
