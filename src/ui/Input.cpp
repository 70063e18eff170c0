#include "ui/Input.hpp"
#include "ui/Terminal.hpp"
#include <unistd.h>
#include <poll.h>
#include <thread>

namespace psistat::ui {

bool has_input_available(int timeout_ms) {
  struct pollfd pfd{.fd=STDIN_FILENO,.events=POLLIN,.revents=0};
  int to = timeout_ms;
  if (to < 0) to = 0;
  int rv = ::poll(&pfd, 1, to);
  return rv > 0 && (pfd.revents & POLLIN);
}

std::vector<char> decode_keys(const unsigned char* buf, size_t n) {
  std::vector<char> out;
  size_t k = 0;
  while (k < n) {
    unsigned char c = buf[k++];
    if (c == 0x1B) {
      // ESC [ <params> <final>; a lone ESC is dropped
      if (k < n && buf[k] == '[') {
        ++k;
        while (k < n && (buf[k] < '@' || buf[k] > '~')) ++k;
        if (k < n) ++k;
      }
      continue;
    }
    if (c < 0x20 || c == 0x7F) continue;
    out.push_back(static_cast<char>(c));
  }
  return out;
}

std::vector<char> TerminalKeySource::read_keys(std::chrono::milliseconds timeout) {
  if (!has_input_available(static_cast<int>(timeout.count()))) return {};
  unsigned char buf[16];
  ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
  if (n == 0) {
    // stdin at EOF stays readable; wait out the period instead of spinning
    std::this_thread::sleep_for(timeout);
    return {};
  }
  if (n < 0) return {};
  return decode_keys(buf, static_cast<size_t>(n));
}

std::vector<char> SleepKeySource::read_keys(std::chrono::milliseconds timeout) {
  if (timeout.count() > 0 && !g_stop.load()) std::this_thread::sleep_for(timeout);
  return {};
}

} // namespace psistat::ui
