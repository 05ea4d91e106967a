#pragma once

#include <array>
#include <cstddef>
#include "model/Snapshot.hpp"

namespace nettui::ui {

// Closed set of views. Every switch over Tab is exhaustive with no default
// label; the build turns -Wswitch into an error so a new tab cannot be missed.
enum class Tab { Connections, Ports, Interfaces };

inline constexpr int kTabCount = 3;
inline constexpr std::array<Tab, kTabCount> kAllTabs{Tab::Connections, Tab::Ports, Tab::Interfaces};

[[nodiscard]] const char* tab_title(Tab t);
[[nodiscard]] Tab next_tab(Tab t);
[[nodiscard]] Tab prev_tab(Tab t);

enum class Command {
  Quit,
  NextTab,
  PrevTab,
  Down,
  Up,
  Top,
  Bottom,
  ShowConnections,
  ShowPorts,
  ShowInterfaces,
  Refresh,
};

// What the coordinator must do after a transition.
enum class Effect { None, Quit, Refresh };

// Header, tab bar, spacer, column header, spacer, count line, help line.
inline constexpr int kChromeRows = 7;

struct NavState {
  Tab tab{Tab::Connections};
  int cursor{0};
  int offset{0};
  int width{0};   // 0 until the first resize
  int height{0};
};

[[nodiscard]] int page_size(const NavState& s);

// Navigation state machine. Owns the record lists of the latest poll and keeps
// cursor/offset valid for them after every transition.
class Navigator {
public:
  Navigator() = default;
  explicit Navigator(Tab start) { state_.tab = start; }

  Effect apply(Command c);
  void resize(int width, int height);
  void refresh(model::Snapshot data);

  [[nodiscard]] const NavState& state() const { return state_; }
  [[nodiscard]] const model::Snapshot& data() const { return data_; }
  [[nodiscard]] bool sized() const { return state_.width > 0 && state_.height > 0; }
  [[nodiscard]] size_t list_len() const { return list_len(state_.tab); }
  [[nodiscard]] size_t list_len(Tab t) const;

private:
  void select(Tab t);
  void clamp_cursor();
  void follow();

  NavState state_{};
  model::Snapshot data_{};
};

} // namespace nettui::ui
