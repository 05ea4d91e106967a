#include "app/EventQueue.hpp"
#include <utility>

namespace nettui::app {

void EventQueue::push(Event ev) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    q_.push_back(std::move(ev));
  }
  cv_.notify_one();
}

Event EventQueue::pop() {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [&]{ return !q_.empty(); });
  Event ev = std::move(q_.front());
  q_.pop_front();
  return ev;
}

std::optional<Event> EventQueue::try_pop() {
  std::lock_guard<std::mutex> lk(mu_);
  if (q_.empty()) return std::nullopt;
  Event ev = std::move(q_.front());
  q_.pop_front();
  return ev;
}

std::optional<Event> EventQueue::pop_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  if (!cv_.wait_for(lk, timeout, [&]{ return !q_.empty(); })) return std::nullopt;
  Event ev = std::move(q_.front());
  q_.pop_front();
  return ev;
}

size_t EventQueue::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return q_.size();
}

} // namespace nettui::app
