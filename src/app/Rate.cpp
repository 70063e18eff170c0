#include "app/Rate.hpp"
#include <cmath>

namespace psistat::app {

double stall_pct(uint64_t delta_us, std::chrono::nanoseconds delta_t) {
  if (delta_t.count() <= 0) return 0.0;
  return 100000.0 * static_cast<double>(delta_us) / static_cast<double>(delta_t.count());
}

std::optional<double> rate(const SampleRing& ring, psistat::model::Resource r,
                           psistat::model::StallKind k, std::size_t lag) {
  if (lag == 0 || ring.size() < lag + 1) return std::nullopt;
  const auto& newer = ring.at(0);
  const auto& older = ring.at(lag);
  const auto& rn = newer.reading(r, k);
  const auto& ro = older.reading(r, k);
  if (!rn.valid || !ro.valid) return std::nullopt;
  // A counter that went backwards was reset; treat the window as idle.
  uint64_t delta_us = rn.total_us >= ro.total_us ? rn.total_us - ro.total_us : 0;
  auto delta_t = std::chrono::duration_cast<std::chrono::nanoseconds>(newer.mono - older.mono);
  return stall_pct(delta_us, delta_t);
}

double round3(double v) { return std::round(v * 1000.0) / 1000.0; }

} // namespace psistat::app
