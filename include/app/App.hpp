#pragma once
#include <string>
#include "app/EventQueue.hpp"
#include "app/InputPump.hpp"
#include "app/Poller.hpp"
#include "collectors/INetSource.hpp"
#include "ui/Config.hpp"
#include "ui/Navigation.hpp"

namespace nettui::app {

// The coordinator: the only thread that touches the navigator or draws.
// Producers (poller, input pump) reach it exclusively through the queue.
class App {
public:
  App(collectors::INetSource& src, const ui::Config& cfg, ui::Theme theme, ui::Tab start);
  App(const App&) = delete;
  App& operator=(const App&) = delete;

  // Start producers, process events until quit, stop producers. Returns the exit code.
  int run();

  // Apply one event to the navigator; false once the loop should end.
  bool handle(Event ev);

  [[nodiscard]] const ui::Navigator& navigator() const { return nav_; }
  [[nodiscard]] EventQueue& queue() { return queue_; }
  [[nodiscard]] Poller& poller() { return poller_; }

private:
  void draw();

  ui::Theme theme_;
  ui::Navigator nav_;
  EventQueue queue_;
  Poller poller_;
  InputPump input_;
};

} // namespace nettui::app
