#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <termios.h>

namespace nettui::ui {

// Set from the SIGINT handler; the input pump turns it into a quit event.
extern std::atomic<bool> g_stop;
extern std::atomic<bool> g_alt_in_use;

void restore_terminal_minimal();
void on_sigint(int);
void on_atexit_restore();

[[nodiscard]] bool tty_stdin();
[[nodiscard]] bool tty_stdout();
[[nodiscard]] bool truecolor_capable();
[[nodiscard]] bool use_unicode();

struct TermSize { int cols; int rows; };
// TIOCGWINSZ on stdout, then COLUMNS/LINES, then 120x40.
[[nodiscard]] TermSize term_size();

// SGR sequences; empty when stdout is not a terminal
[[nodiscard]] std::string sgr(const char* code);
[[nodiscard]] std::string sgr_reset();
[[nodiscard]] std::string sgr_palette_idx(int idx);
[[nodiscard]] std::string sgr_truecolor(int r, int g, int b);

// Write all of buf, retrying on EINTR/EAGAIN; gives up silently on other errors.
void best_effort_write(int fd, const char* buf, size_t len);

class RawTermGuard {
  bool active_{false};
  termios old_{};
  int old_flags_{0};
public:
  RawTermGuard();
  ~RawTermGuard();
  RawTermGuard(const RawTermGuard&) = delete;
  RawTermGuard& operator=(const RawTermGuard&) = delete;
  [[nodiscard]] bool active() const { return active_; }
};

class CursorGuard {
  bool active_{false};
public:
  CursorGuard();
  ~CursorGuard();
  CursorGuard(const CursorGuard&) = delete;
  CursorGuard& operator=(const CursorGuard&) = delete;
};

class AltScreenGuard {
  bool active_{false};
public:
  explicit AltScreenGuard(bool enable);
  ~AltScreenGuard();
  AltScreenGuard(const AltScreenGuard&) = delete;
  AltScreenGuard& operator=(const AltScreenGuard&) = delete;
};

// Full-screen session for the dashboard: checks both ends are terminals, enters
// raw mode, hides the cursor, optionally switches to the alternate screen and
// installs the SIGINT/atexit restore hooks. Guards unwind in reverse order.
class TerminalSession {
public:
  explicit TerminalSession(bool alt_screen);
  TerminalSession(const TerminalSession&) = delete;
  TerminalSession& operator=(const TerminalSession&) = delete;

  [[nodiscard]] bool ok() const { return error_ == nullptr; }
  // Why the session could not start (nullptr when ok())
  [[nodiscard]] const char* error() const { return error_; }

private:
  const char* error_{nullptr};
  bool tty_{false};
  RawTermGuard raw_;
  CursorGuard cursor_;
  AltScreenGuard alt_;
};

} // namespace nettui::ui
