#include "ui/Navigation.hpp"
#include <algorithm>
#include <utility>

namespace nettui::ui {

const char* tab_title(Tab t) {
  switch (t) {
    case Tab::Connections: return "Connections";
    case Tab::Ports:       return "Ports";
    case Tab::Interfaces:  return "Interfaces";
  }
  return "";
}

Tab next_tab(Tab t) {
  switch (t) {
    case Tab::Connections: return Tab::Ports;
    case Tab::Ports:       return Tab::Interfaces;
    case Tab::Interfaces:  return Tab::Connections;
  }
  return Tab::Connections;
}

Tab prev_tab(Tab t) {
  switch (t) {
    case Tab::Connections: return Tab::Interfaces;
    case Tab::Ports:       return Tab::Connections;
    case Tab::Interfaces:  return Tab::Ports;
  }
  return Tab::Connections;
}

int page_size(const NavState& s) {
  return std::max(1, s.height - kChromeRows);
}

size_t Navigator::list_len(Tab t) const {
  switch (t) {
    case Tab::Connections: return data_.connections.size();
    case Tab::Ports:       return data_.ports.size();
    case Tab::Interfaces:  return data_.interfaces.size();
  }
  return 0;
}

Effect Navigator::apply(Command c) {
  Effect effect = Effect::None;
  switch (c) {
    case Command::Quit:            return Effect::Quit;
    case Command::NextTab:         select(next_tab(state_.tab)); break;
    case Command::PrevTab:         select(prev_tab(state_.tab)); break;
    case Command::ShowConnections: select(Tab::Connections); break;
    case Command::ShowPorts:       select(Tab::Ports); break;
    case Command::ShowInterfaces:  select(Tab::Interfaces); break;
    case Command::Down:            state_.cursor += 1; break;
    case Command::Up:              state_.cursor = std::max(0, state_.cursor - 1); break;
    case Command::Top:             state_.cursor = 0; state_.offset = 0; break;
    case Command::Bottom:          state_.cursor = static_cast<int>(list_len()) - 1; break;
    case Command::Refresh:         effect = Effect::Refresh; break;
  }
  clamp_cursor();
  follow();
  return effect;
}

void Navigator::resize(int width, int height) {
  state_.width = std::max(0, width);
  state_.height = std::max(0, height);
  follow();
}

void Navigator::refresh(model::Snapshot data) {
  data_ = std::move(data);
  clamp_cursor();
  follow();
}

void Navigator::select(Tab t) {
  state_.tab = t;
  state_.cursor = 0;
  state_.offset = 0;
}

void Navigator::clamp_cursor() {
  int max = static_cast<int>(list_len()) - 1;
  if (max < 0) max = 0;
  state_.cursor = std::clamp(state_.cursor, 0, max);
}

// Keep the cursor row inside [offset, offset + page)
void Navigator::follow() {
  const int page = page_size(state_);
  if (state_.cursor < state_.offset) {
    state_.offset = state_.cursor;
  } else if (state_.cursor >= state_.offset + page) {
    state_.offset = state_.cursor - page + 1;
  }
  if (state_.offset < 0) state_.offset = 0;
}

} // namespace nettui::ui
