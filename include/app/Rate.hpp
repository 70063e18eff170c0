#pragma once
#include "app/SampleRing.hpp"
#include "model/Pressure.hpp"
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace psistat::app {

// Lags (in samples) the table shows; ~1s/3s/10s at the default period.
inline constexpr std::array<std::size_t, 3> kRateLags{1, 3, 10};
inline constexpr std::size_t kRingCapacity = kRateLags.back() + 1;

// Percent of wall time stalled: 100 * (delta_us / 1e6) / (delta_ns / 1e9).
// Not clamped to 100; a zero window yields 0.
[[nodiscard]] double stall_pct(uint64_t delta_us, std::chrono::nanoseconds delta_t);

// Rate for one series between the newest batch and the one 'lag' samples
// back. nullopt when the ring holds fewer than lag+1 batches or either end
// has no reading for the series yet.
[[nodiscard]] std::optional<double> rate(const SampleRing& ring, psistat::model::Resource r,
                                         psistat::model::StallKind k, std::size_t lag);

// Round to three decimals, as events record it.
[[nodiscard]] double round3(double v);

} // namespace psistat::app
