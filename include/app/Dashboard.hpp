#pragma once
#include "app/EventHistory.hpp"
#include "app/Rate.hpp"
#include "app/SampleRing.hpp"
#include "app/Threshold.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace psistat::app {

// All mutable dashboard state. Owned by the TickScheduler and only touched
// from its thread.
struct DashboardState {
  SampleRing ring{kRingCapacity};
  EventHistory history{};
  Threshold threshold{};
  std::size_t event_lag{kRateLags.front()};
  std::chrono::milliseconds period{1000};
  bool brief{false};
  bool show_help{false};
  uint64_t ticks{0};
};

// Next lag in kRateLags after 'lag', wrapping to the first.
[[nodiscard]] std::size_t next_event_lag(std::size_t lag);

} // namespace psistat::app
