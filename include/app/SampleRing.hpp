#pragma once
#include "model/Pressure.hpp"
#include <cstddef>
#include <deque>

namespace psistat::app {

// Bounded newest-first history of sample batches. Index 0 is the newest.
class SampleRing {
public:
  explicit SampleRing(std::size_t capacity);

  // Insert at the front; the oldest batch falls off once capacity is exceeded.
  void push(psistat::model::SampleBatch batch);

  [[nodiscard]] std::size_t size() const { return batches_.size(); }
  [[nodiscard]] std::size_t capacity() const { return capacity_; }
  [[nodiscard]] bool empty() const { return batches_.empty(); }

  // 'back' samples before the newest; caller checks size() first.
  [[nodiscard]] const psistat::model::SampleBatch& at(std::size_t back) const { return batches_[back]; }
  [[nodiscard]] const psistat::model::SampleBatch& newest() const { return batches_.front(); }

private:
  std::size_t capacity_;
  std::deque<psistat::model::SampleBatch> batches_;
};

} // namespace psistat::app
