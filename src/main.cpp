#include <cstdio>
#include <iostream>
#include <vector>
#include <string>

#include "app/App.hpp"
#include "app/Cli.hpp"
#include "app/Normalizer.hpp"
#include "collectors/ProcfsNetSource.hpp"
#include "ui/Config.hpp"
#include "ui/Navigation.hpp"
#include "ui/Formatting.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"

using namespace nettui;

static void print_usage(std::FILE* out) {
  std::fprintf(out,
    "Usage: nettui [--interval-ms MS] [--tab connections|ports|interfaces] [--once]\n"
    "Keys: q quit  tab/l/h switch  1-3 jump to tab  j/k move  g/G top/bottom  r refresh\n"
    "Env:  NETTUI_INTERVAL_MS, NETTUI_ALT_SCREEN, NETTUI_COLOR, NO_COLOR, NETTUI_DEBUG\n");
}

// One plain frame holding every row of `tab`, written to stdout.
static int print_once(collectors::INetSource& src, ui::Tab tab) {
  ui::Navigator nav(tab);
  nav.refresh(app::normalize(src));
  const int rows = static_cast<int>(nav.list_len()) + ui::kChromeRows;
  nav.resize(ui::term_size().cols, rows);
  auto frame = ui::render_frame(nav.state(), nav.data(), ui::Theme::plain(ui::use_unicode()), ui::format_time_now());
  for (const auto& line : frame) {
    auto end = line.find_last_not_of(' ');
    std::cout << (end == std::string::npos ? std::string() : line.substr(0, end + 1)) << '\n';
  }
  return 0;
}

int main(int argc, char** argv) {
  ui::Config cfg = ui::load_config();
  app::CliOptions opts;
  std::string error;
  if (!app::parse_args(std::vector<std::string>(argv + 1, argv + argc), cfg, opts, error)) {
    std::fprintf(stderr, "nettui: %s\n", error.c_str());
    print_usage(stderr);
    return 2;
  }
  if (opts.help) {
    print_usage(stdout);
    return 0;
  }
  const ui::Tab tab = opts.tab;

  collectors::ProcfsNetSource source;
  if (opts.once) return print_once(source, tab);

  ui::TerminalSession session(cfg.alt_screen);
  if (!session.ok()) {
    std::fprintf(stderr, "nettui: %s\n", session.error());
    return 1;
  }
  if (ui::debug_enabled()) {
    std::fprintf(stderr, "nettui: source=%s interval=%dms\n", source.name(), cfg.interval_ms);
  }

  app::App app(source, cfg, ui::make_theme(cfg), tab);
  return app.run();
}
