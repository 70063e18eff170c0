#include "app/EventDetector.hpp"
#include "app/Rate.hpp"

namespace psistat::app {

std::vector<psistat::model::Event> EventDetector::detect(const SampleRing& ring, int threshold, std::size_t lag,
                                                         std::chrono::steady_clock::time_point mono,
                                                         std::chrono::system_clock::time_point wall) const {
  std::vector<psistat::model::Event> out;
  for (auto r : psistat::model::kResources) {
    for (auto k : psistat::model::kKinds) {
      auto pct = rate(ring, r, k, lag);
      if (!pct) continue;
      double rounded = round3(*pct);
      if (rounded < static_cast<double>(threshold)) continue;
      out.push_back(psistat::model::Event{mono, wall, r, k, rounded, threshold, lag});
    }
  }
  return out;
}

} // namespace psistat::app
