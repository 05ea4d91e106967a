#pragma once
#include <stop_token>
#include <thread>
#include <unistd.h>
#include "app/EventQueue.hpp"

namespace nettui::app {

// Reads key bytes from `fd` and turns them into events. Also watches the
// terminal size, emits a clock tick once per second and forwards the
// interrupt flag as a QuitEvent.
class InputPump {
public:
  explicit InputPump(EventQueue& q, int fd = STDIN_FILENO) : q_(q), fd_(fd) {}
  ~InputPump();
  InputPump(const InputPump&) = delete;
  InputPump& operator=(const InputPump&) = delete;

  void start();
  void stop();

private:
  void run(std::stop_token st);
  EventQueue& q_;
  int fd_;
  std::jthread thread_{};
};

} // namespace nettui::app
