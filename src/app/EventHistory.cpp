#include "app/EventHistory.hpp"

namespace psistat::app {

EventHistory::EventHistory(std::size_t capacity) : capacity_(capacity < 1 ? 1 : capacity) {}

void EventHistory::insert(const psistat::model::Event& e) {
  events_.push_front(e);
  if (events_.size() > capacity_) events_.resize(capacity_);
}

} // namespace psistat::app
