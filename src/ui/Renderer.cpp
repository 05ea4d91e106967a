#include "ui/Renderer.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <unistd.h>

namespace nettui::ui {

namespace {

struct Column { const char* title; int width; };

constexpr Column kConnectionColumns[] = {
  {"PROTO", 7}, {"LOCAL", 21}, {"REMOTE", 21}, {"STATE", 11}, {"PROCESS", 15},
};
constexpr Column kPortColumns[] = {
  {"PORT", 7}, {"PROTO", 7}, {"ADDRESS", 16}, {"PID", 8}, {"PROCESS", 20},
};
constexpr Column kInterfaceColumns[] = {
  {"NAME", 12}, {"STATE", 6}, {"ADDRESS", 22}, {"RX", 12}, {"TX", 12},
};
constexpr size_t kColumnCount = 5;

const Column* columns_for(Tab t) {
  switch (t) {
    case Tab::Connections: return kConnectionColumns;
    case Tab::Ports:       return kPortColumns;
    case Tab::Interfaces:  return kInterfaceColumns;
  }
  return kConnectionColumns;
}

std::string fit(const std::string& value, int w) {
  return trunc_pad(truncate(value, w), w);
}

// Cell text for row i of the active list. Everything read from the host is
// sanitized; process names in particular are set by unprivileged users.
std::vector<std::string> row_cells(Tab t, const model::Snapshot& d, size_t i) {
  switch (t) {
    case Tab::Connections: {
      const auto& c = d.connections[i];
      return {c.proto, sanitize_for_display(c.local), sanitize_for_display(c.remote),
              sanitize_for_display(c.state), sanitize_for_display(c.process)};
    }
    case Tab::Ports: {
      const auto& p = d.ports[i];
      return {std::to_string(p.port), p.proto, sanitize_for_display(p.addr), std::to_string(p.pid),
              sanitize_for_display(p.process)};
    }
    case Tab::Interfaces: {
      const auto& f = d.interfaces[i];
      std::string addr = f.addrs.empty() ? std::string("-") : sanitize_for_display(f.addrs.front());
      return {sanitize_for_display(f.name), f.up ? "up" : "down", addr,
              format_bytes(f.rx_bytes), format_bytes(f.tx_bytes)};
    }
  }
  return {};
}

std::string count_text(Tab t, size_t n) {
  switch (t) {
    case Tab::Connections: return std::to_string(n) + " connections";
    case Tab::Ports:       return std::to_string(n) + " listening ports";
    case Tab::Interfaces:  return std::to_string(n) + " interfaces";
  }
  return {};
}

std::string styled(const std::string& style, const std::string& text, const Theme& theme) {
  if (style.empty()) return text;
  return style + text + theme.reset;
}

std::string join_row(const Column* cols, const std::vector<std::string>& cells,
                     const std::string& gutter, size_t styled_cell = kColumnCount,
                     const std::string& cell_style = {}, const std::string& reset = {}) {
  std::string line = gutter;
  for (size_t c = 0; c < kColumnCount && c < cells.size(); ++c) {
    if (c) line += ' ';
    std::string cell = fit(cells[c], cols[c].width);
    if (c == styled_cell && !cell_style.empty()) cell = cell_style + cell + reset;
    line += cell;
  }
  return line;
}

std::string header_line(int width, const Theme& theme, const std::string& clock) {
  return lr_align(width, styled(theme.title, " nettui ", theme), styled(theme.dim, clock, theme));
}

std::string tab_bar(Tab active, const Theme& theme) {
  std::string line;
  for (size_t i = 0; i < kAllTabs.size(); ++i) {
    Tab t = kAllTabs[i];
    if (i) line += ' ';
    const std::string title = tab_title(t);
    if (t != active) { line += styled(theme.tab_inactive, " " + title + " ", theme); continue; }
    if (theme.tab_active.empty()) line += "[" + title + "]";
    else line += styled(theme.tab_active, " " + title + " ", theme);
  }
  return line;
}

} // namespace

std::vector<std::string> render_frame(const NavState& s, const model::Snapshot& data,
                                      const Theme& theme, const std::string& clock) {
  if (s.width <= 0 || s.height <= 0) return {"loading..."};

  const int w = s.width;
  const int page = page_size(s);
  const Column* cols = columns_for(s.tab);
  const size_t total = [&]{
    switch (s.tab) {
      case Tab::Connections: return data.connections.size();
      case Tab::Ports:       return data.ports.size();
      case Tab::Interfaces:  return data.interfaces.size();
    }
    return size_t{0};
  }();

  std::vector<std::string> out;
  out.reserve(static_cast<size_t>(page + kChromeRows));
  out.push_back(clip_pad(header_line(w, theme, clock), w));
  out.push_back(clip_pad(tab_bar(s.tab, theme), w));
  out.push_back(std::string(w, ' '));

  std::vector<std::string> titles;
  for (size_t c = 0; c < kColumnCount; ++c) titles.emplace_back(cols[c].title);
  out.push_back(styled(theme.header, clip_pad(join_row(cols, titles, "  "), w), theme));

  const size_t first = std::min(total, static_cast<size_t>(std::max(0, s.offset)));
  const size_t last = std::min(total, first + static_cast<size_t>(page));
  for (size_t i = first; i < last; ++i) {
    const bool sel = static_cast<int>(i) == s.cursor;
    auto cells = row_cells(s.tab, data, i);
    // Color the interface state cell only when the row is not highlighted
    size_t state_cell = kColumnCount;
    std::string state_style;
    if (s.tab == Tab::Interfaces && !sel) {
      state_cell = 1;
      state_style = data.interfaces[i].up ? theme.state_up : theme.state_down;
    }
    std::string line = clip_pad(join_row(cols, cells, sel ? "> " : "  ", state_cell, state_style, theme.reset), w);
    out.push_back(sel ? styled(theme.selected, line, theme) : line);
  }
  for (size_t i = last - first; i < static_cast<size_t>(page); ++i) out.push_back(std::string(w, ' '));

  out.push_back(std::string(w, ' '));
  out.push_back(styled(theme.dim, clip_pad(count_text(s.tab, total), w), theme));
  const std::string sep = theme.unicode ? " • " : " | ";
  const std::string help = "q quit" + sep + "tab/1-3 switch" + sep + "j/k navigate" + sep + "r refresh";
  out.push_back(styled(theme.dim, clip_pad(help, w), theme));
  return out;
}

void present(const std::vector<std::string>& frame, int cols, int rows) {
  std::string buf;
  buf.reserve(static_cast<size_t>(std::max(1, rows)) * static_cast<size_t>(std::max(1, cols) + 16) + 16);
  buf += "\x1B[H";
  const int n = std::min<int>(static_cast<int>(frame.size()), std::max(0, rows));
  for (int i = 0; i < n; ++i) {
    buf += clip_pad(frame[static_cast<size_t>(i)], cols);
    buf += "\x1B[0m";
    if (i < n - 1) buf += "\r\n";
  }
  // Clear whatever an earlier, taller frame left below this one
  buf += "\x1B[J";
  best_effort_write(STDOUT_FILENO, buf.data(), buf.size());
}

} // namespace nettui::ui
