#include "app/Poller.hpp"
#include <utility>
#include "app/Normalizer.hpp"

namespace nettui::app {

Poller::Poller(collectors::INetSource& src, std::chrono::milliseconds interval, Sink sink)
  : src_(src), interval_(interval), sink_(std::move(sink)) {}

Poller::~Poller() { stop(); }

void Poller::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Poller::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

void Poller::request_refresh() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    refresh_pending_ = true;
  }
  cv_.notify_all();
}

void Poller::run(std::stop_token st) {
  while (!st.stop_requested()) {
    model::Snapshot snap = normalize(src_);
    snap.seq = ++seq_;
    passes_.fetch_add(1, std::memory_order_acq_rel);
    sink_(std::move(snap));

    std::unique_lock<std::mutex> lk(mu_);
    // Returns early on stop or on a refresh request (possibly made mid-pass)
    cv_.wait_for(lk, st, interval_, [&]{ return refresh_pending_; });
    if (st.stop_requested()) break;
    refresh_pending_ = false;
  }
}

} // namespace nettui::app
