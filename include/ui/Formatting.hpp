#pragma once

#include <cstdint>
#include <string>

namespace nettui::ui {

// UTF-8 text width utilities (ANSI SGR sequences count as zero width)
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Cut to at most `limit` display characters, marking the cut with "..." when
// the limit leaves room for at least one character of content.
std::string truncate(const std::string& s, int limit);

// Replace C0/C1 control bytes (ESC included) with '?' so host-supplied text
// such as process names cannot inject terminal sequences.
std::string sanitize_for_display(const std::string& s);

// Text formatting and alignment
std::string trunc_pad(const std::string& s, int w);
std::string clip_pad(const std::string& s, int w);
std::string lr_align(int iw, const std::string& left, const std::string& right);

// 1023 -> "1023 B", 1024 -> "1.0 KB", binary multiples up to EB
std::string format_bytes(uint64_t bytes);

// Local wall-clock time as HH:MM:SS
std::string format_time_now();

} // namespace nettui::ui
