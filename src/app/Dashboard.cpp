#include "app/Dashboard.hpp"

namespace psistat::app {

std::size_t next_event_lag(std::size_t lag) {
  for (std::size_t i = 0; i < kRateLags.size(); ++i) {
    if (kRateLags[i] == lag) return kRateLags[(i + 1) % kRateLags.size()];
  }
  return kRateLags.front();
}

} // namespace psistat::app
