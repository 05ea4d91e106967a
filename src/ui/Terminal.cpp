#include "ui/Terminal.hpp"
#include <unistd.h>
#include <termios.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <string>

namespace nettui::ui {

std::atomic<bool> g_stop{false};
std::atomic<bool> g_alt_in_use{false};

static constexpr char kShowCursor[] = "\x1B[?25h";
static constexpr char kHideCursor[] = "\x1B[?25l";
static constexpr char kAltOn[]      = "\x1B[?1049h";
static constexpr char kAltOff[]     = "\x1B[?1049l";

template <size_t N>
static void write_seq(const char (&seq)[N]) { best_effort_write(STDOUT_FILENO, seq, N - 1); }

void best_effort_write(int fd, const char* buf, size_t len) {
  while (len > 0) {
    ssize_t n = ::write(fd, buf, len);
    if (n > 0) { buf += n; len -= static_cast<size_t>(n); continue; }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
    return;
  }
}

// Async-signal-safe: only write(2) and atomics
void restore_terminal_minimal() {
  if (g_alt_in_use.load()) write_seq(kAltOff);
  write_seq(kShowCursor);
  write_seq("\x1B[0m");
}

void on_sigint(int) { g_stop.store(true); }

void on_atexit_restore() {
  std::fflush(stdout);
  restore_terminal_minimal();
  if (::isatty(STDOUT_FILENO) == 1) tcdrain(STDOUT_FILENO);
}

bool tty_stdin() { return ::isatty(STDIN_FILENO) == 1; }
bool tty_stdout() { return ::isatty(STDOUT_FILENO) == 1; }

static bool env_contains_any(const char* name, std::initializer_list<const char*> needles) {
  const char* v = std::getenv(name);
  if (!v || !*v) return false;
  std::string s = v;
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  for (const char* n : needles) if (s.find(n) != std::string::npos) return true;
  return false;
}

bool truecolor_capable() { return env_contains_any("COLORTERM", {"truecolor", "24bit"}); }

bool use_unicode() {
  // First non-empty of LC_ALL, LC_CTYPE, LANG decides
  for (const char* var : {"LC_ALL", "LC_CTYPE", "LANG"}) {
    const char* v = std::getenv(var);
    if (v && *v) return env_contains_any(var, {"utf-8", "utf8"});
  }
  return false;
}

static int env_dim(const char* name, int fallback) {
  const char* v = std::getenv(name);
  if (!v || !*v) return fallback;
  try { int n = std::stoi(v); return n > 0 ? n : fallback; } catch (const std::exception&) { return fallback; }
}

TermSize term_size() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0)
    return {ws.ws_col, ws.ws_row};
  return {env_dim("COLUMNS", 120), env_dim("LINES", 40)};
}

std::string sgr(const char* code) {
  if (!tty_stdout()) return {};
  return std::string("\x1B[") + code + "m";
}

std::string sgr_reset() { return sgr("0"); }

std::string sgr_palette_idx(int idx) {
  idx = std::clamp(idx, 0, 255);
  if (idx <= 7) return sgr(std::to_string(30 + idx).c_str());
  if (idx <= 15) return sgr(std::to_string(90 + idx - 8).c_str());
  return sgr(("38;5;" + std::to_string(idx)).c_str());
}

std::string sgr_truecolor(int r, int g, int b) {
  r = std::clamp(r, 0, 255); g = std::clamp(g, 0, 255); b = std::clamp(b, 0, 255);
  return sgr(("38;2;" + std::to_string(r) + ";" + std::to_string(g) + ";" + std::to_string(b)).c_str());
}

RawTermGuard::RawTermGuard() {
  if (!tty_stdin() || tcgetattr(STDIN_FILENO, &old_) != 0) return;
  termios neo = old_;
  neo.c_lflag &= ~(ICANON | ECHO);
  neo.c_cc[VMIN] = 0;
  neo.c_cc[VTIME] = 0;
  if (tcsetattr(STDIN_FILENO, TCSANOW, &neo) != 0) return;
  old_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
  if (old_flags_ >= 0) fcntl(STDIN_FILENO, F_SETFL, old_flags_ | O_NONBLOCK);
  active_ = true;
}

RawTermGuard::~RawTermGuard() {
  if (!active_) return;
  tcsetattr(STDIN_FILENO, TCSANOW, &old_);
  if (old_flags_ >= 0) fcntl(STDIN_FILENO, F_SETFL, old_flags_);
}

CursorGuard::CursorGuard() {
  if (!tty_stdout()) return;
  write_seq(kHideCursor);
  active_ = true;
}

CursorGuard::~CursorGuard() {
  if (active_) write_seq(kShowCursor);
}

AltScreenGuard::AltScreenGuard(bool enable) {
  if (!enable || !tty_stdout()) return;
  write_seq(kAltOn);
  write_seq("\x1B[2J\x1B[H");
  active_ = true;
  g_alt_in_use.store(true);
}

AltScreenGuard::~AltScreenGuard() {
  if (!active_) return;
  write_seq(kAltOff);
  g_alt_in_use.store(false);
}

TerminalSession::TerminalSession(bool alt_screen)
  : tty_(tty_stdin() && tty_stdout()),
    raw_(),
    cursor_(),
    alt_(alt_screen && tty_) {
  if (!tty_) { error_ = "stdin and stdout must be a terminal (try --once)"; return; }
  if (!raw_.active()) { error_ = "could not put the terminal into raw mode"; return; }
  std::signal(SIGINT, on_sigint);
  std::atexit(&on_atexit_restore);
}

} // namespace nettui::ui
