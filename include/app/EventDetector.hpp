#pragma once
#include "app/SampleRing.hpp"
#include "model/Pressure.hpp"
#include <chrono>
#include <cstddef>
#include <vector>

namespace psistat::app {

// Turns the newest rates into events. No cooldown: a series that stays at or
// above the threshold yields one event per tick.
class EventDetector {
public:
  std::vector<psistat::model::Event> detect(const SampleRing& ring, int threshold, std::size_t lag,
                                            std::chrono::steady_clock::time_point mono,
                                            std::chrono::system_clock::time_point wall) const;
};

} // namespace psistat::app
