#include "app/SampleRing.hpp"
#include <utility>

namespace psistat::app {

SampleRing::SampleRing(std::size_t capacity) : capacity_(capacity < 1 ? 1 : capacity) {}

void SampleRing::push(psistat::model::SampleBatch batch) {
  batches_.push_front(std::move(batch));
  while (batches_.size() > capacity_) batches_.pop_back();
}

} // namespace psistat::app
