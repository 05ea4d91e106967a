#include "minitest.hpp"
#include "ui/Formatting.hpp"
#include "ui/Renderer.hpp"

using namespace nettui;
using ui::Command; using ui::Tab;

static bool starts_with(const std::string& s, const std::string& p) { return s.rfind(p, 0) == 0; }

static std::string rtrim(std::string s) {
  while (!s.empty() && s.back() == ' ') s.pop_back();
  return s;
}

static model::ConnectionRecord conn(std::string proto, std::string local, std::string remote,
                                    std::string state, int32_t pid, std::string process) {
  model::ConnectionRecord c;
  c.proto = std::move(proto); c.local = std::move(local); c.remote = std::move(remote);
  c.state = std::move(state); c.pid = pid; c.process = std::move(process);
  return c;
}

TEST(render_placeholder_before_first_resize) {
  ui::Navigator nav;
  auto frame = ui::render_frame(nav.state(), nav.data(), ui::Theme::plain(), "12:00:00");
  ASSERT_EQ(frame.size(), (size_t)1);
  ASSERT_EQ(frame[0], std::string("loading..."));
}

TEST(render_empty_connections_frame) {
  ui::Navigator nav;
  nav.resize(80, 12);
  nav.refresh(model::Snapshot{});
  auto frame = ui::render_frame(nav.state(), nav.data(), ui::Theme::plain(), "12:34:56");
  ASSERT_EQ(frame.size(), (size_t)12);
  for (const auto& line : frame) ASSERT_EQ(ui::display_cols(line), 80);
  ASSERT_TRUE(starts_with(frame[0], " nettui "));
  ASSERT_EQ(rtrim(frame[0]).substr(rtrim(frame[0]).size() - 8), std::string("12:34:56"));
  ASSERT_TRUE(frame[1].find("[Connections]") != std::string::npos);
  ASSERT_TRUE(frame[1].find(" Ports ") != std::string::npos);
  ASSERT_TRUE(starts_with(frame[3], "  PROTO   LOCAL"));
  for (int i = 4; i < 9; ++i) ASSERT_EQ(rtrim(frame[static_cast<size_t>(i)]), std::string());
  ASSERT_EQ(rtrim(frame[10]), std::string("0 connections"));
  ASSERT_EQ(rtrim(frame[11]), std::string("q quit | tab/1-3 switch | j/k navigate | r refresh"));
  ASSERT_EQ(nav.state().cursor, 0);
}

TEST(render_unicode_help_separators) {
  ui::Navigator nav;
  nav.resize(80, 10);
  auto frame = ui::render_frame(nav.state(), nav.data(), ui::Theme::plain(true), "00:00:00");
  ASSERT_EQ(rtrim(frame.back()), std::string("q quit \xE2\x80\xA2 tab/1-3 switch \xE2\x80\xA2 j/k navigate \xE2\x80\xA2 r refresh"));
}

TEST(render_connection_rows_and_cursor_gutter) {
  model::Snapshot snap;
  snap.connections.push_back(conn("tcp", "10.0.0.2:5000", "1.1.1.1:443", "ESTABLISHED", 9, "curl"));
  snap.connections.push_back(conn("tcp6", "[2001:db8:0:0:0:0:1234:5678]:443", "*:0", "LISTEN", 1, "a-very-long-process-name"));
  ui::Navigator nav;
  nav.resize(100, 12);
  nav.refresh(std::move(snap));
  auto frame = ui::render_frame(nav.state(), nav.data(), ui::Theme::plain(), "00:00:00");
  ASSERT_EQ(rtrim(frame[4]),
            std::string("> tcp     10.0.0.2:5000         1.1.1.1:443           ESTABLISHED curl"));
  ASSERT_TRUE(starts_with(frame[5], "  tcp6    [2001:db8:0:0:0:0:... *:0"));
  ASSERT_TRUE(frame[5].find("a-very-long-...") != std::string::npos);
  ASSERT_EQ(rtrim(frame[10]), std::string("2 connections"));

  nav.apply(Command::Down);
  frame = ui::render_frame(nav.state(), nav.data(), ui::Theme::plain(), "00:00:00");
  ASSERT_TRUE(starts_with(frame[4], "  tcp "));
  ASSERT_TRUE(starts_with(frame[5], "> tcp6"));
}

TEST(render_pages_follow_offset) {
  model::Snapshot snap;
  for (int i = 0; i < 20; ++i)
    snap.connections.push_back(conn("udp", "*:" + std::to_string(1000 + i), "*:0", "NONE", 0, ""));
  ui::Navigator nav;
  nav.resize(90, 10); // page of 3
  nav.refresh(std::move(snap));
  for (int i = 0; i < 5; ++i) nav.apply(Command::Down);
  auto frame = ui::render_frame(nav.state(), nav.data(), ui::Theme::plain(), "00:00:00");
  ASSERT_EQ(frame.size(), (size_t)10);
  ASSERT_TRUE(frame[4].find("*:1003") != std::string::npos);
  ASSERT_TRUE(frame[6].find("*:1005") != std::string::npos);
  ASSERT_TRUE(starts_with(frame[6], "> "));
  ASSERT_EQ(rtrim(frame[8]), std::string("20 connections"));
}

TEST(render_ports_and_interfaces_tabs) {
  model::Snapshot snap;
  model::PortRecord p; p.port = 22; p.proto = "tcp"; p.addr = "*"; p.pid = 812; p.process = "sshd";
  snap.ports.push_back(p);
  model::InterfaceRecord up; up.name = "eth0"; up.up = true; up.addrs = {"192.168.1.5/24", "fe80::1/64"};
  up.rx_bytes = 1048576; up.tx_bytes = 1023;
  model::InterfaceRecord down; down.name = "wlan0"; down.up = false;
  snap.interfaces.push_back(up);
  snap.interfaces.push_back(down);

  ui::Navigator nav(Tab::Ports);
  nav.resize(90, 12);
  nav.refresh(std::move(snap));
  auto frame = ui::render_frame(nav.state(), nav.data(), ui::Theme::plain(), "00:00:00");
  ASSERT_TRUE(frame[1].find("[Ports]") != std::string::npos);
  ASSERT_TRUE(starts_with(frame[3], "  PORT    PROTO   ADDRESS"));
  ASSERT_EQ(rtrim(frame[4]), std::string("> 22      tcp     *                812      sshd"));
  ASSERT_EQ(rtrim(frame[10]), std::string("1 listening ports"));

  nav.apply(Command::ShowInterfaces);
  frame = ui::render_frame(nav.state(), nav.data(), ui::Theme::plain(), "00:00:00");
  ASSERT_TRUE(frame[1].find("[Interfaces]") != std::string::npos);
  ASSERT_EQ(rtrim(frame[4]), std::string("> eth0         up     192.168.1.5/24         1.0 MB       1023 B"));
  ASSERT_EQ(rtrim(frame[5]), std::string("  wlan0        down   -                      0 B          0 B"));
  ASSERT_EQ(rtrim(frame[10]), std::string("2 interfaces"));
}

TEST(render_every_tab_has_columns_and_footer) {
  ui::Navigator nav;
  nav.resize(120, 8);
  for (Tab t : ui::kAllTabs) {
    ui::NavState s = nav.state();
    s.tab = t;
    auto frame = ui::render_frame(s, nav.data(), ui::Theme::plain(), "00:00:00");
    ASSERT_EQ(frame.size(), (size_t)(1 + ui::kChromeRows));
    ASSERT_TRUE(starts_with(rtrim(frame[frame.size() - 2]), "0 "));
    ASSERT_TRUE(frame[1].find(std::string("[") + ui::tab_title(t) + "]") != std::string::npos);
  }
}

TEST(render_selected_row_uses_theme_style) {
  model::Snapshot snap;
  snap.connections.push_back(conn("tcp", "a:1", "b:2", "LISTEN", 0, ""));
  ui::Navigator nav;
  nav.resize(80, 10);
  nav.refresh(std::move(snap));
  ui::Theme th = ui::Theme::plain();
  th.selected = "\x1B[7m";
  th.reset = "\x1B[0m";
  auto frame = ui::render_frame(nav.state(), nav.data(), th, "00:00:00");
  ASSERT_TRUE(starts_with(frame[4], "\x1B[7m> tcp"));
  ASSERT_EQ(ui::display_cols(frame[4]), 80);
}

TEST(render_strips_control_bytes_from_host_text) {
  model::Snapshot snap;
  snap.connections.push_back(conn("tcp", "10.0.0.2:22", "10.0.0.9:5000", "ESTABLISHED", 66,
                                  "x\x1B[2J\x1B[31mevil\x1B]0;pwned\x07"));
  model::InterfaceRecord f; f.name = "eth\x1B[1m0"; f.up = true; f.addrs = {"10.0.0.2/24\r"};
  snap.interfaces.push_back(f);
  ui::Navigator nav;
  nav.resize(80, 10);
  nav.refresh(std::move(snap));
  auto frame = ui::render_frame(nav.state(), nav.data(), ui::Theme::plain(), "00:00:00");
  ASSERT_TRUE(frame[4].find('\x1B') == std::string::npos);
  ASSERT_TRUE(frame[4].find('\x07') == std::string::npos);
  ASSERT_TRUE(frame[4].find("x?[2J?[31m") != std::string::npos);
  ASSERT_EQ(frame[4].size(), (size_t)80);

  nav.apply(Command::ShowInterfaces);
  frame = ui::render_frame(nav.state(), nav.data(), ui::Theme::plain(), "00:00:00");
  ASSERT_TRUE(frame[4].find('\x1B') == std::string::npos);
  ASSERT_TRUE(frame[4].find('\r') == std::string::npos);
  ASSERT_TRUE(starts_with(frame[4], "> eth?[1m0"));
}
