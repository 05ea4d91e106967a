#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include "app/Events.hpp"

namespace nettui::app {

// Unbounded multi-producer, single-consumer FIFO feeding the coordinator.
class EventQueue {
public:
  EventQueue() = default;
  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  void push(Event ev);
  Event pop();
  std::optional<Event> try_pop();
  std::optional<Event> pop_for(std::chrono::milliseconds timeout);
  [[nodiscard]] size_t size() const;

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Event> q_;
};

} // namespace nettui::app
