#pragma once
#include "model/Pressure.hpp"
#include <cstddef>
#include <deque>

namespace psistat::app {

// Newest-first log of threshold events; oldest entries age out past capacity.
class EventHistory {
public:
  static constexpr std::size_t kDefaultCapacity = 100;

  explicit EventHistory(std::size_t capacity = kDefaultCapacity);

  void insert(const psistat::model::Event& e);

  [[nodiscard]] std::size_t size() const { return events_.size(); }
  [[nodiscard]] std::size_t capacity() const { return capacity_; }
  [[nodiscard]] bool empty() const { return events_.empty(); }

  // Ordered newest-first; valid until the next insert.
  [[nodiscard]] const std::deque<psistat::model::Event>& view() const { return events_; }

private:
  std::size_t capacity_;
  std::deque<psistat::model::Event> events_;
};

} // namespace psistat::app
