#include "minitest.hpp"
#include "FakeNetSource.hpp"
#include "app/App.hpp"
#include "app/EventQueue.hpp"

using namespace nettui;
using namespace std::chrono_literals;

TEST(queue_preserves_arrival_order) {
  app::EventQueue q;
  q.push(app::CommandEvent{ui::Command::Down});
  q.push(app::ResizeEvent{80, 24});
  q.push(app::TickEvent{});
  q.push(app::QuitEvent{});
  ASSERT_EQ(q.size(), (size_t)4);
  ASSERT_TRUE(std::holds_alternative<app::CommandEvent>(q.pop()));
  auto r = q.pop();
  ASSERT_TRUE(std::holds_alternative<app::ResizeEvent>(r));
  ASSERT_EQ(std::get<app::ResizeEvent>(r).rows, 24);
  ASSERT_TRUE(std::holds_alternative<app::TickEvent>(*q.try_pop()));
  ASSERT_TRUE(std::holds_alternative<app::QuitEvent>(*q.pop_for(10ms)));
  ASSERT_TRUE(!q.try_pop().has_value());
  ASSERT_TRUE(!q.pop_for(10ms).has_value());
}

TEST(queue_hands_events_across_threads) {
  app::EventQueue q;
  std::jthread producer([&]{
    for (int i = 0; i < 100; ++i) q.push(app::ResizeEvent{i, i});
  });
  for (int i = 0; i < 100; ++i) {
    auto ev = q.pop();
    ASSERT_EQ(std::get<app::ResizeEvent>(ev).cols, i);
  }
}

TEST(app_handles_each_event_kind) {
  FakeNetSource src;
  app::App app(src, ui::Config{}, ui::Theme::plain(), ui::Tab::Ports);
  ASSERT_TRUE(app.navigator().state().tab == ui::Tab::Ports);
  ASSERT_TRUE(app.handle(app::ResizeEvent{100, 30}));
  ASSERT_EQ(app.navigator().state().height, 30);
  model::Snapshot snap;
  snap.seq = 1;
  snap.ports.resize(4);
  ASSERT_TRUE(app.handle(app::DataEvent{std::move(snap)}));
  ASSERT_EQ(app.navigator().list_len(), (size_t)4);
  ASSERT_TRUE(app.handle(app::CommandEvent{ui::Command::Bottom}));
  ASSERT_EQ(app.navigator().state().cursor, 3);
  ASSERT_TRUE(app.handle(app::TickEvent{}));
  ASSERT_TRUE(!app.handle(app::CommandEvent{ui::Command::Quit}));
  ASSERT_TRUE(!app.handle(app::QuitEvent{}));
}

TEST(app_zero_connections_with_interfaces_end_to_end) {
  FakeNetSource src;
  src.conns_ok = false;
  src.ifs = { {"eth0", true, false, {"10.0.0.2/24"}} };
  src.counters = { {"eth0", 10, 20} };
  app::App app(src, ui::Config{}, ui::Theme::plain(), ui::Tab::Connections);
  app.handle(app::ResizeEvent{80, 20});
  app.poller().start();
  auto ev = app.queue().pop_for(3000ms);
  app.poller().stop();
  ASSERT_TRUE(ev.has_value());
  ASSERT_TRUE(std::holds_alternative<app::DataEvent>(*ev));
  ASSERT_TRUE(app.handle(std::move(*ev)));
  ASSERT_EQ(app.navigator().list_len(ui::Tab::Connections), (size_t)0);
  ASSERT_EQ(app.navigator().list_len(ui::Tab::Interfaces), (size_t)1);
  ASSERT_EQ(app.navigator().state().cursor, 0);
  ASSERT_EQ(app.navigator().data().seq, (uint64_t)1);
}

TEST(app_hung_source_delays_data_but_not_input) {
  GatedNetSource src;
  src.conns = { raw_conn(1, 2, "0.0.0.0", 22, "", 0, "LISTEN", 0) };
  app::App app(src, ui::Config{}, ui::Theme::plain(), ui::Tab::Connections);
  app.handle(app::ResizeEvent{80, 20});
  app.poller().start();
  ASSERT_TRUE(wait_until([&]{ return src.entered.load() == 1; }));

  // Acquisition is stuck; the coordinator still processes input
  app.queue().push(app::CommandEvent{ui::Command::NextTab});
  app.queue().push(app::CommandEvent{ui::Command::Down});
  for (int i = 0; i < 2; ++i) {
    auto ev = app.queue().pop_for(1000ms);
    ASSERT_TRUE(ev.has_value());
    ASSERT_TRUE(std::holds_alternative<app::CommandEvent>(*ev));
    ASSERT_TRUE(app.handle(std::move(*ev)));
  }
  ASSERT_TRUE(app.navigator().state().tab == ui::Tab::Ports);
  ASSERT_EQ(app.navigator().state().cursor, 0);
  ASSERT_EQ(app.poller().passes(), (uint64_t)0);

  // A refresh key while stuck is coalesced into the next pass
  ASSERT_TRUE(app.handle(app::CommandEvent{ui::Command::Refresh}));
  src.open();
  auto data = app.queue().pop_for(3000ms);
  ASSERT_TRUE(data.has_value());
  ASSERT_TRUE(std::holds_alternative<app::DataEvent>(*data));
  ASSERT_TRUE(app.handle(std::move(*data)));
  ASSERT_EQ(app.navigator().list_len(), (size_t)1);
  ASSERT_TRUE(wait_until([&]{ return app.poller().passes() == 2; }));
  app.poller().stop();
  ASSERT_EQ(src.max_in_flight.load(), 1);
}
