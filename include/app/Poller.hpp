#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include "collectors/INetSource.hpp"
#include "model/Snapshot.hpp"

namespace nettui::app {

// Runs normalization passes on a worker thread: one immediately, then one
// `interval` after the previous pass finished. Passes never overlap; refresh
// requests made during a pass collapse into a single follow-up pass.
// An acquisition call that never returns also blocks stop().
class Poller {
public:
  using Sink = std::function<void(model::Snapshot)>;

  Poller(collectors::INetSource& src, std::chrono::milliseconds interval, Sink sink);
  ~Poller();
  Poller(const Poller&) = delete;
  Poller& operator=(const Poller&) = delete;

  void start();
  void stop();
  void request_refresh();

  [[nodiscard]] uint64_t passes() const { return passes_.load(std::memory_order_acquire); }

private:
  void run(std::stop_token st);

  collectors::INetSource& src_;
  std::chrono::milliseconds interval_;
  Sink sink_;
  std::mutex mu_;
  std::condition_variable_any cv_;
  bool refresh_pending_{false};
  uint64_t seq_{0};
  std::atomic<uint64_t> passes_{0};
  std::jthread thread_{};
};

} // namespace nettui::app
