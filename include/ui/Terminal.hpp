#pragma once

#include <atomic>
#include <string>
#include <termios.h>

namespace psistat::ui {

// Set from SIGINT/SIGTERM/SIGHUP; the tick loop polls it between waits.
extern std::atomic<bool> g_stop;

// Signal handlers hand the screen back (async-signal-safe) and set g_stop.
// No SA_RESTART, so a pending poll() returns EINTR.
void install_signal_handlers();
// atexit hook: flush stdout, then the same restore the handlers do.
void on_atexit_restore();

[[nodiscard]] bool tty_stdout();

struct TermSize {
  int rows{24};
  int cols{80};
};
// Window size of stdout; 24x80 when it has none.
[[nodiscard]] TermSize term_size();

// Colour and attribute prefixes for the display roles. All empty when stdout
// is not a tty, so piped output stays plain.
[[nodiscard]] bool truecolor_capable();
[[nodiscard]] std::string role_palette(int idx);
[[nodiscard]] std::string role_rgb(int r, int g, int b);
[[nodiscard]] std::string attr_bold();
[[nodiscard]] std::string attr_reset();

// Owns the terminal while the dashboard is up: stdin raw and non-blocking,
// cursor hidden, alternate screen when asked for. Undone in reverse order on
// destruction. suspend() gives the normal screen back for plain output.
class TerminalSession {
public:
  explicit TerminalSession(bool alt_screen);
  ~TerminalSession();
  TerminalSession(const TerminalSession&) = delete;
  TerminalSession& operator=(const TerminalSession&) = delete;

  void suspend();
  void resume();
  [[nodiscard]] bool suspended() const { return suspended_; }

private:
  bool raw_{false};
  termios saved_{};
  int saved_flags_{0};
  bool cursor_hidden_{false};
  bool alt_{false};
  bool suspended_{false};
};

} // namespace psistat::ui
