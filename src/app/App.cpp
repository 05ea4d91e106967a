#include "app/App.hpp"
#include <type_traits>
#include <utility>
#include "ui/Formatting.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"

namespace nettui::app {

App::App(collectors::INetSource& src, const ui::Config& cfg, ui::Theme theme, ui::Tab start)
  : theme_(std::move(theme)),
    nav_(start),
    poller_(src, std::chrono::milliseconds(cfg.interval_ms),
            [this](model::Snapshot snap){ queue_.push(DataEvent{std::move(snap)}); }),
    input_(queue_) {}

bool App::handle(Event ev) {
  return std::visit([this](auto&& e) -> bool {
    using T = std::decay_t<decltype(e)>;
    if constexpr (std::is_same_v<T, CommandEvent>) {
      switch (nav_.apply(e.cmd)) {
        case ui::Effect::None:    return true;
        case ui::Effect::Quit:    return false;
        case ui::Effect::Refresh: poller_.request_refresh(); return true;
      }
      return true;
    } else if constexpr (std::is_same_v<T, ResizeEvent>) {
      nav_.resize(e.cols, e.rows);
      return true;
    } else if constexpr (std::is_same_v<T, TickEvent>) {
      return true;
    } else if constexpr (std::is_same_v<T, DataEvent>) {
      nav_.refresh(std::move(e.snap));
      return true;
    } else {
      static_assert(std::is_same_v<T, QuitEvent>);
      return false;
    }
  }, std::move(ev));
}

void App::draw() {
  const auto& s = nav_.state();
  auto frame = ui::render_frame(s, nav_.data(), theme_, ui::format_time_now());
  if (!nav_.sized()) {
    const auto size = ui::term_size();
    ui::present(frame, size.cols, size.rows);
    return;
  }
  ui::present(frame, s.width, s.height);
}

int App::run() {
  input_.start();
  poller_.start();
  draw();
  while (true) {
    Event ev = queue_.pop();
    if (!handle(std::move(ev))) break;
    draw();
  }
  input_.stop();
  poller_.stop();
  return 0;
}

} // namespace nettui::app
