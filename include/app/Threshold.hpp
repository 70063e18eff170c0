#pragma once

namespace psistat::app {

// Event threshold in percent: always a multiple of 5 within [5, 95].
class Threshold {
public:
  static constexpr int kMin = 5;
  static constexpr int kMax = 95;
  static constexpr int kStep = 5;
  static constexpr int kDefault = 20;

  explicit Threshold(int pct = kDefault) : pct_(normalize(pct)) {}

  // Nearest multiple of 5, then clamped.
  [[nodiscard]] static int normalize(int pct);

  void raise() { pct_ = normalize(pct_ + kStep); }
  void lower() { pct_ = normalize(pct_ - kStep); }
  void set(int pct) { pct_ = normalize(pct); }
  [[nodiscard]] int value() const { return pct_; }

private:
  int pct_;
};

} // namespace psistat::app
