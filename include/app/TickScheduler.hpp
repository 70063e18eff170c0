#pragma once
#include "app/Control.hpp"
#include "app/Dashboard.hpp"
#include "app/EventDetector.hpp"
#include "app/KeySource.hpp"
#include "collectors/ICounterSource.hpp"
#include "model/Pressure.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace psistat::ui {
class ITextSurface;
class Renderer;
}

namespace psistat::app {

struct SchedulerOptions {
  std::chrono::milliseconds period{1000};
  int initial_threshold{Threshold::kDefault};
  uint64_t max_ticks{0};                       // 0 = run until quit
  KeyMap keymap{default_keymap()};
  const std::atomic<bool>* stop_flag{nullptr}; // polled between waits
  std::ostream* dump_out{nullptr};             // history dump target; stdout when null
  bool dump_waits_for_key{true};
};

enum class Phase { Sampling, Rendering, AwaitingInput, Terminating };

[[nodiscard]] const char* phase_name(Phase p);

// Single-threaded sample -> detect -> render -> wait loop. Ticks land on
// start + n*period; a tick that overruns skips the deadlines it missed
// instead of bursting to catch up.
class TickScheduler {
public:
  TickScheduler(psistat::collectors::ICounterSource& source, psistat::ui::ITextSurface& surface,
                IKeySource& keys, const psistat::ui::Renderer& renderer, SchedulerOptions opts = {});

  // Returns the process exit code: 0 after quit/stop/max_ticks, 1 when the
  // counter source failed (error() says why).
  int run();

  // One tick without waiting; false when the source could not be read.
  bool tick_at(std::chrono::steady_clock::time_point mono, std::chrono::system_clock::time_point wall);

  bool sample_once(std::chrono::steady_clock::time_point mono, std::chrono::system_clock::time_point wall);
  // Newly detected events, in detection order; they are already in history.
  std::vector<psistat::model::Event> detect_events(std::chrono::steady_clock::time_point mono,
                                                   std::chrono::system_clock::time_point wall);
  void render(std::chrono::steady_clock::time_point now);

  // Apply one control action; false means the loop should end.
  bool dispatch(ControlAction a);
  // Route raw keys through the keymap; false once a key asked to quit.
  bool handle_keys(const std::vector<char>& keys);

  [[nodiscard]] static std::chrono::steady_clock::time_point advance_deadline(
      std::chrono::steady_clock::time_point deadline, std::chrono::milliseconds period,
      std::chrono::steady_clock::time_point now);

  [[nodiscard]] const DashboardState& state() const { return st_; }
  [[nodiscard]] Phase phase() const { return phase_; }
  [[nodiscard]] const std::string& error() const { return error_; }

private:
  bool await_input(std::chrono::steady_clock::time_point deadline);
  void dump_history();
  [[nodiscard]] bool stopped() const;

  psistat::collectors::ICounterSource& source_;
  psistat::ui::ITextSurface& surface_;
  IKeySource& keys_;
  const psistat::ui::Renderer& renderer_;
  SchedulerOptions opts_;
  EventDetector detector_{};
  DashboardState st_{};
  // Handed back to the source each tick so malformed lines keep the prior value
  psistat::model::CounterSample last_{};
  uint64_t seq_{0};
  Phase phase_{Phase::Sampling};
  std::string error_;
};

} // namespace psistat::app
