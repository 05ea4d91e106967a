#include "app/InputPump.hpp"
#include <chrono>
#include <poll.h>
#include <string_view>
#include "ui/Input.hpp"
#include "ui/Terminal.hpp"

using namespace std::chrono;

namespace nettui::app {

InputPump::~InputPump() { stop(); }

void InputPump::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void InputPump::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

void InputPump::run(std::stop_token st) {
  int last_cols = -1, last_rows = -1;
  auto next_tick = steady_clock::now() + 1s;
  while (!st.stop_requested()) {
    if (ui::g_stop.load()) { q_.push(QuitEvent{}); break; }

    const auto size = ui::term_size();
    if (size.cols != last_cols || size.rows != last_rows) {
      last_cols = size.cols; last_rows = size.rows;
      q_.push(ResizeEvent{size.cols, size.rows});
    }

    struct pollfd pfd{.fd=fd_,.events=POLLIN,.revents=0};
    int rv = ::poll(&pfd, 1, 100);
    if (rv > 0 && (pfd.revents & POLLIN)) {
      char buf[64];
      ssize_t n = ::read(fd_, buf, sizeof(buf));
      if (n > 0) {
        for (const auto& key : ui::decode_keys(std::string_view(buf, static_cast<size_t>(n)))) {
          if (auto cmd = ui::command_for(key)) q_.push(CommandEvent{*cmd});
        }
      } else {
        std::this_thread::sleep_for(100ms); // EOF: poll would return at once
      }
    } else if (rv > 0) {
      std::this_thread::sleep_for(100ms); // POLLHUP/POLLERR/POLLNVAL
    }

    auto now = steady_clock::now();
    if (now >= next_tick) {
      q_.push(TickEvent{});
      next_tick = now + 1s;
    }
  }
}

} // namespace nettui::app
