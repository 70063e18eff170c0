#include "app/Threshold.hpp"
#include <algorithm>
#include <cmath>

namespace psistat::app {

int Threshold::normalize(int pct) {
  long r = std::lround(static_cast<double>(pct) / kStep) * kStep;
  return static_cast<int>(std::clamp<long>(r, kMin, kMax));
}

} // namespace psistat::app
