#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <cstdlib>
#include <string>

namespace nettui::ui {

bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b) {
  if (hex.size()!=7 || hex[0] != '#') return false;
  auto hexv = [&](char c)->int{
    if (c>='0'&&c<='9') return c-'0';
    if (c>='a'&&c<='f') return c-'a'+10;
    if (c>='A'&&c<='F') return c-'A'+10;
    return -1;
  };
  int v1=hexv(hex[1]), v2=hexv(hex[2]), v3=hexv(hex[3]), v4=hexv(hex[4]), v5=hexv(hex[5]), v6=hexv(hex[6]);
  if (v1<0||v2<0||v3<0||v4<0||v5<0||v6<0) return false;
  r = v1*16+v2; g = v3*16+v4; b = v5*16+v6;
  return true;
}

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  // Accept both NETTUI_ and nettui_ prefixes
  std::string alt;
  std::string n(name);
  if (n.rfind("NETTUI_", 0) == 0) {
    alt = std::string("nettui_") + n.substr(7);
  } else if (n.rfind("nettui_", 0) == 0) {
    alt = std::string("NETTUI_") + n.substr(7);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

bool debug_enabled() {
  static const bool on = env_flag("NETTUI_DEBUG", false);
  return on;
}

Config load_config() {
  Config c{};
  c.interval_ms = std::clamp(getenv_int("NETTUI_INTERVAL_MS", 2000), 250, 60000);
  c.alt_screen  = env_flag("NETTUI_ALT_SCREEN", true);
  c.color       = env_flag("NETTUI_COLOR", true) && std::getenv("NO_COLOR") == nullptr;
  return c;
}

// Resolve a color role: NETTUI_<ROLE>_HEX (truecolor terminals) -> compiled
// truecolor default -> NETTUI_<ROLE>_IDX palette index -> compiled index.
static std::string resolve_color(const std::string& role, int def_idx, const char* def_hex) {
  const bool tc = truecolor_capable();
  if (tc) {
    int r = 0, g = 0, b = 0;
    const char* hex = getenv_compat(("NETTUI_" + role + "_HEX").c_str());
    if (hex && parse_hex_rgb(hex, r, g, b)) return sgr_truecolor(r, g, b);
    if (def_hex && parse_hex_rgb(def_hex, r, g, b) && !getenv_compat(("NETTUI_" + role + "_IDX").c_str()))
      return sgr_truecolor(r, g, b);
  }
  return sgr_palette_idx(getenv_int(("NETTUI_" + role + "_IDX").c_str(), def_idx));
}

Theme make_theme(const Config& cfg) {
  if (!cfg.color || !tty_stdout()) return Theme::plain(use_unicode());
  Theme t;
  t.unicode = use_unicode();
  const std::string accent = resolve_color("ACCENT", 6, "#88C0D0");
  const std::string dim    = resolve_color("DIM", 8, "#4C566A");
  t.title        = sgr("1") + accent;
  t.dim          = dim;
  t.header       = sgr("1") + resolve_color("HEADER", 4, "#81A1C1");
  t.selected     = sgr("1;7");
  t.tab_active   = sgr("1;7") + accent;
  t.tab_inactive = dim;
  t.state_up     = resolve_color("UP", 2, "#A3BE8C");
  t.state_down   = resolve_color("DOWN", 1, "#BF616A");
  t.reset        = sgr_reset();
  return t;
}

} // namespace nettui::ui
