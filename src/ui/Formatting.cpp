#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <cstdio>
#include <ctime>

namespace nettui::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    // Skip ANSI escape sequences
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++; // skip final byte
      continue;
    }
    int len = u8_len((unsigned char)s[i]);
    i += len;
    cols += 1;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size() && seen < cols) {
    // Copy ANSI escape sequences without counting them
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      size_t start = i;
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++; // include final byte
      out.append(s, start, i - start);
      continue;
    }
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1;
    out.append(s, i, len);
    i += len;
    seen += 1;
  }
  return out;
}

std::string truncate(const std::string& s, int limit) {
  if (limit <= 0) return std::string();
  if (display_cols(s) <= limit) return s;
  if (limit <= 3) return take_cols(s, limit);
  return take_cols(s, limit - 3) + "...";
}

std::string sanitize_for_display(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c < 0x20 || c == 0x7F) { out += '?'; continue; }
    // C1 controls arrive as U+0080..U+009F (0xC2 0x80..0x9F)
    if (c == 0xC2 && i + 1 < s.size()) {
      unsigned char n = static_cast<unsigned char>(s[i + 1]);
      if (n >= 0x80 && n <= 0x9F) { out += '?'; ++i; continue; }
    }
    out += static_cast<char>(c);
  }
  return out;
}

std::string trunc_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  if (w <= 1) return take_cols(s, w);
  return take_cols(s, w - 1) + (use_unicode()? "…" : ".");
}

// Hard clip (no marker) then pad; used for whole frame lines.
std::string clip_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  return take_cols(s, w);
}

std::string lr_align(int iw, const std::string& left, const std::string& right){
  if (iw <= 0) return std::string();
  int rvis = display_cols(right);
  int tlw = iw - rvis - 1;
  if (tlw < 0) tlw = 0;
  std::string l = trunc_pad(left, tlw);
  int lvis = display_cols(l);
  int space = iw - lvis - rvis;
  if (space < 0) space = 0;
  return l + std::string(space, ' ') + right;
}

std::string format_bytes(uint64_t bytes) {
  constexpr uint64_t unit = 1024;
  if (bytes < unit) return std::to_string(bytes) + " B";
  uint64_t div = unit; int exp = 0;
  for (uint64_t n = bytes / unit; n >= unit; n /= unit) {
    div *= unit;
    exp++;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f %cB", (double)bytes / (double)div, "KMGTPE"[exp]);
  return buf;
}

std::string format_time_now() {
  std::time_t t = std::time(nullptr);
  std::tm lt{};
  localtime_r(&t, &lt);
  char buf[16];
  if (std::strftime(buf, sizeof(buf), "%H:%M:%S", &lt) == 0) return std::string();
  return std::string(buf);
}

} // namespace nettui::ui
