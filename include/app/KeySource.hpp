#pragma once
#include <chrono>
#include <vector>

namespace psistat::app {

// Bounded keystroke wait. This is the loop's only blocking point.
class IKeySource {
public:
  virtual ~IKeySource() = default;
  // Wait up to 'timeout' for input and return the bytes that arrived
  // (empty on timeout or interruption).
  virtual std::vector<char> read_keys(std::chrono::milliseconds timeout) = 0;
};

} // namespace psistat::app
