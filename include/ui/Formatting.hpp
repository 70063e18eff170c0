#pragma once

#include <chrono>
#include <string>

namespace psistat::ui {

// UTF-8 text width utilities (SGR sequences count as zero width)
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Clip to w columns, pad with trailing blanks
std::string clip_pad(const std::string& s, int w);
// Clip to w columns, pad with leading blanks
std::string rpad_trunc(const std::string& s, int w);

// Fixed-point percent in a right-aligned field, e.g. fmt_pct(3.14159, 5, 1) == "  3.1"
std::string fmt_pct(double pct, int width, int precision);

// Two-unit cascading elapsed time: 8 -> "8s", 65 -> "1m5s", 5025 -> "1h23m".
// With pad=true a zero leading unit is replaced by four blanks ("    8s").
std::string compact_duration(double secs, bool pad = false);

// "MM-DD HH:MM:SS.mmm" in local time
std::string format_event_time(std::chrono::system_clock::time_point tp);

// strftime() of the current local time; empty on failure
std::string format_time_now(const std::string& fmt);

} // namespace psistat::ui
