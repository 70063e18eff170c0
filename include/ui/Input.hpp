#pragma once

#include "app/KeySource.hpp"

namespace psistat::ui {

// Helper to check for available input
bool has_input_available(int timeout_ms);

// Keys from the (raw-mode) terminal on stdin. Escape sequences such as
// arrow keys are dropped.
class TerminalKeySource : public psistat::app::IKeySource {
public:
  std::vector<char> read_keys(std::chrono::milliseconds timeout) override;
};

// No keyboard: just waits out the timeout (debug mode).
class SleepKeySource : public psistat::app::IKeySource {
public:
  std::vector<char> read_keys(std::chrono::milliseconds timeout) override;
};

// Strip ESC [ ... sequences and control bytes from a raw read.
std::vector<char> decode_keys(const unsigned char* buf, size_t n);

} // namespace psistat::ui
