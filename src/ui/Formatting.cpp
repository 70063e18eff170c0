#include "ui/Formatting.hpp"
#include <cmath>
#include <cstdio>
#include <ctime>

namespace psistat::ui {

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

std::string clip_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  return take_cols(s, w);
}

std::string rpad_trunc(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return std::string(w - cols, ' ') + s;
  return take_cols(s, w);
}

std::string fmt_pct(double pct, int width, int precision) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%*.*f", width, precision, pct);
  return std::string(buf);
}

std::string compact_duration(double secs, bool pad) {
  static constexpr long divs[] = {60, 60, 24, 7, 52, 9999999};
  static constexpr char units[] = {'s', 'm', 'h', 'd', 'w', 'y'};
  long ago = std::lround(std::fabs(secs));
  // (lower, upper) starts as (secs, mins); cascade until the upper fits its unit
  long lower = ago % 60, upper = ago / 60;
  int uidx = 1;
  for (size_t i = 1; i < sizeof(divs) / sizeof(divs[0]); ++i) {
    if (upper < divs[i]) break;
    lower = upper % divs[i];
    upper = upper / divs[i];
    ++uidx;
  }
  std::string out;
  if (upper) out = std::to_string(upper) + units[uidx];
  else if (pad) out = "    ";
  out += std::to_string(lower) + units[uidx - 1];
  return out;
}

std::string format_event_time(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm lt{};
  localtime_r(&t, &lt);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  if (ms < 0) ms += 1000;
  char buf[48];
  if (std::strftime(buf, sizeof(buf), "%m-%d %H:%M:%S", &lt) == 0) return std::string();
  char out[64];
  std::snprintf(out, sizeof(out), "%s.%03d", buf, static_cast<int>(ms));
  return std::string(out);
}

std::string format_time_now(const std::string& fmt) {
  std::time_t t = std::time(nullptr);
  std::tm lt{};
  localtime_r(&t, &lt);
  char buf[64];
  if (std::strftime(buf, sizeof(buf), fmt.c_str(), &lt) == 0) return std::string();
  return std::string(buf);
}

} // namespace psistat::ui
