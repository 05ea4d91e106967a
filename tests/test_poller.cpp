#include "minitest.hpp"
#include "FakeNetSource.hpp"
#include "app/Poller.hpp"
#include <mutex>
#include <vector>

using namespace nettui;
using namespace std::chrono_literals;

TEST(poller_first_pass_is_immediate_and_sequenced) {
  FakeNetSource src;
  src.conns = { raw_conn(1, 2, "0.0.0.0", 22, "", 0, "LISTEN", 0) };
  std::mutex mu;
  std::vector<uint64_t> seqs;
  std::vector<size_t> port_counts;
  app::Poller poller(src, 30ms, [&](model::Snapshot s){
    std::lock_guard<std::mutex> lk(mu);
    seqs.push_back(s.seq);
    port_counts.push_back(s.ports.size());
  });
  poller.start();
  ASSERT_TRUE(wait_until([&]{ return poller.passes() >= 3; }));
  poller.stop();
  std::lock_guard<std::mutex> lk(mu);
  ASSERT_TRUE(seqs.size() >= 3);
  for (size_t i = 0; i < seqs.size(); ++i) {
    ASSERT_EQ(seqs[i], (uint64_t)(i + 1));
    ASSERT_EQ(port_counts[i], (size_t)1);
  }
}

TEST(poller_passes_never_overlap) {
  GatedNetSource src;
  src.open();
  src.work = 10ms;
  app::Poller poller(src, 1ms, [](model::Snapshot){});
  poller.start();
  std::jthread spammer([&](std::stop_token st){
    while (!st.stop_requested()) { poller.request_refresh(); std::this_thread::sleep_for(1ms); }
  });
  ASSERT_TRUE(wait_until([&]{ return poller.passes() >= 8; }));
  spammer.request_stop();
  spammer.join();
  poller.stop();
  ASSERT_EQ(src.max_in_flight.load(), 1);
}

TEST(poller_refresh_requests_coalesce_during_pass) {
  GatedNetSource src;
  std::atomic<int> delivered{0};
  app::Poller poller(src, 10s, [&](model::Snapshot){ delivered.fetch_add(1); });
  poller.start();
  ASSERT_TRUE(wait_until([&]{ return src.entered.load() == 1; }));
  for (int i = 0; i < 5; ++i) poller.request_refresh();
  src.open();
  ASSERT_TRUE(wait_until([&]{ return poller.passes() == 2; }));
  std::this_thread::sleep_for(150ms);
  ASSERT_EQ(poller.passes(), (uint64_t)2);
  ASSERT_EQ(delivered.load(), 2);

  // Idle poller: a refresh request starts a pass right away
  poller.request_refresh();
  ASSERT_TRUE(wait_until([&]{ return poller.passes() == 3; }, 1000ms));
  poller.stop();
}

TEST(poller_stop_interrupts_interval_wait) {
  FakeNetSource src;
  app::Poller poller(src, 60s, [](model::Snapshot){});
  poller.start();
  ASSERT_TRUE(wait_until([&]{ return poller.passes() == 1; }));
  auto t0 = std::chrono::steady_clock::now();
  poller.stop();
  ASSERT_TRUE(std::chrono::steady_clock::now() - t0 < 2s);
  poller.stop(); // idempotent
}
