#include "ui/Terminal.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <algorithm>
#include <cctype>
#include <csignal>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>

namespace psistat::ui {

std::atomic<bool> g_stop{false};

namespace {

constexpr const char kAltOn[] = "\x1B[?1049h\x1B[2J\x1B[H";
constexpr const char kAltOff[] = "\x1B[?1049l";
constexpr const char kCursorHide[] = "\x1B[?25l";
constexpr const char kCursorShow[] = "\x1B[?25h";
constexpr const char kReset[] = "\x1B[0m";

// What the session currently holds, mirrored for the signal path.
std::atomic<bool> g_alt_shown{false};
std::atomic<bool> g_cursor_hidden{false};
std::atomic<bool> g_termios_saved{false};
termios g_saved_termios{};

template <std::size_t N>
void emit(const char (&seq)[N]) {
  // Nothing useful to do if the write fails
  if (::write(STDOUT_FILENO, seq, N - 1) < 0) return;
}

// Async-signal-safe: only write(2), tcsetattr(3) and atomics.
void hand_back_terminal() {
  bool held = false;
  if (g_alt_shown.exchange(false)) { emit(kAltOff); held = true; }
  if (g_cursor_hidden.exchange(false)) { emit(kCursorShow); held = true; }
  if (held) emit(kReset);
  if (g_termios_saved.exchange(false)) tcsetattr(STDIN_FILENO, TCSANOW, &g_saved_termios);
}

void on_stop_signal(int) {
  hand_back_terminal();
  g_stop.store(true);
}

} // namespace

void install_signal_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_stop_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  for (int sig : {SIGINT, SIGTERM, SIGHUP}) sigaction(sig, &sa, nullptr);
}

void on_atexit_restore() {
  std::fflush(stdout);
  hand_back_terminal();
  if (tty_stdout()) tcdrain(STDOUT_FILENO);
}

bool tty_stdout() {
  return ::isatty(STDOUT_FILENO) == 1;
}

TermSize term_size() {
  TermSize ts;
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0 && ws.ws_col > 0) {
    ts.rows = ws.ws_row;
    ts.cols = ws.ws_col;
  }
  return ts;
}

bool truecolor_capable() {
  const char* ct = std::getenv("COLORTERM");
  if (!ct) return false;
  std::string s = ct;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s == "truecolor" || s == "24bit";
}

// 0..7 and 8..15 map to the basic and bright SGR ranges, the rest to 38;5.
std::string role_palette(int idx) {
  if (!tty_stdout()) return {};
  idx = std::clamp(idx, 0, 255);
  char buf[24];
  if (idx < 8) std::snprintf(buf, sizeof(buf), "\x1B[%dm", 30 + idx);
  else if (idx < 16) std::snprintf(buf, sizeof(buf), "\x1B[%dm", 90 + idx - 8);
  else std::snprintf(buf, sizeof(buf), "\x1B[38;5;%dm", idx);
  return buf;
}

std::string role_rgb(int r, int g, int b) {
  if (!tty_stdout()) return {};
  char buf[32];
  std::snprintf(buf, sizeof(buf), "\x1B[38;2;%d;%d;%dm",
                std::clamp(r, 0, 255), std::clamp(g, 0, 255), std::clamp(b, 0, 255));
  return buf;
}

std::string attr_bold() {
  return tty_stdout() ? std::string("\x1B[1m") : std::string();
}

std::string attr_reset() {
  return tty_stdout() ? std::string(kReset) : std::string();
}

TerminalSession::TerminalSession(bool alt_screen) {
  if (::isatty(STDIN_FILENO) == 1 && tcgetattr(STDIN_FILENO, &saved_) == 0) {
    g_saved_termios = saved_;
    g_termios_saved.store(true);
    termios raw = saved_;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSANOW, &raw);
    saved_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
    fcntl(STDIN_FILENO, F_SETFL, saved_flags_ | O_NONBLOCK);
    raw_ = true;
  }
  if (!tty_stdout()) return;
  emit(kCursorHide);
  cursor_hidden_ = true;
  g_cursor_hidden.store(true);
  if (alt_screen) {
    emit(kAltOn);
    alt_ = true;
    g_alt_shown.store(true);
  }
}

TerminalSession::~TerminalSession() {
  if (alt_ && g_alt_shown.exchange(false)) emit(kAltOff);
  if (cursor_hidden_ && g_cursor_hidden.exchange(false)) emit(kCursorShow);
  if (raw_) {
    g_termios_saved.store(false);
    tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
    fcntl(STDIN_FILENO, F_SETFL, saved_flags_);
  }
}

void TerminalSession::suspend() {
  if (suspended_) return;
  suspended_ = true;
  if (alt_ && g_alt_shown.exchange(false)) emit(kAltOff);
  if (cursor_hidden_ && g_cursor_hidden.exchange(false)) emit(kCursorShow);
}

void TerminalSession::resume() {
  if (!suspended_) return;
  suspended_ = false;
  if (cursor_hidden_) {
    emit(kCursorHide);
    g_cursor_hidden.store(true);
  }
  if (alt_) {
    emit(kAltOn);
    g_alt_shown.store(true);
  }
}

} // namespace psistat::ui
