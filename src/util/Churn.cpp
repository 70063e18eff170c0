#include "util/Churn.hpp"

#include <deque>

namespace psistat::util {

struct ChurnEvent { std::chrono::steady_clock::time_point t; ChurnKind kind; };

// Only the tick thread records or reads these.
static std::deque<ChurnEvent> g_events;

static constexpr auto kKeep = std::chrono::seconds(60);

static void prune_older_than(std::chrono::steady_clock::time_point cutoff) {
  while (!g_events.empty() && g_events.front().t < cutoff) g_events.pop_front();
}

void note_churn(ChurnKind kind) {
  auto now = std::chrono::steady_clock::now();
  prune_older_than(now - kKeep);
  g_events.push_back(ChurnEvent{now, kind});
}

int count_recent_kind_ms(ChurnKind kind, int ms) {
  auto now = std::chrono::steady_clock::now();
  auto cutoff = now - std::chrono::milliseconds(ms);
  prune_older_than(now - kKeep);
  int c = 0;
  for (const auto& e : g_events) if (e.t >= cutoff && e.kind == kind) ++c;
  return c;
}

void reset_churn() { g_events.clear(); }

} // namespace psistat::util
