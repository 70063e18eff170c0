#include "app/TickScheduler.hpp"
#include "ui/Renderer.hpp"
#include "ui/Surface.hpp"
#include <iostream>
#include <utility>

using namespace std::chrono;

namespace psistat::app {

const char* phase_name(Phase p) {
  switch (p) {
    case Phase::Sampling: return "sampling";
    case Phase::Rendering: return "rendering";
    case Phase::AwaitingInput: return "awaiting-input";
    case Phase::Terminating: return "terminating";
  }
  return "?";
}

TickScheduler::TickScheduler(psistat::collectors::ICounterSource& source, psistat::ui::ITextSurface& surface,
                             IKeySource& keys, const psistat::ui::Renderer& renderer, SchedulerOptions opts)
    : source_(source), surface_(surface), keys_(keys), renderer_(renderer), opts_(std::move(opts)) {
  if (opts_.period.count() <= 0) opts_.period = milliseconds(1000);
  st_.period = opts_.period;
  st_.threshold.set(opts_.initial_threshold);
}

bool TickScheduler::stopped() const {
  return opts_.stop_flag && opts_.stop_flag->load();
}

steady_clock::time_point TickScheduler::advance_deadline(steady_clock::time_point deadline, milliseconds period,
                                                         steady_clock::time_point now) {
  if (period.count() <= 0) return now;
  do { deadline += period; } while (deadline <= now);
  return deadline;
}

bool TickScheduler::sample_once(steady_clock::time_point mono, system_clock::time_point wall) {
  if (!source_.sample(last_)) {
    error_ = source_.error();
    if (error_.empty()) error_ = std::string("cannot sample ") + source_.name();
    return false;
  }
  psistat::model::SampleBatch batch;
  batch.seq = ++seq_;
  batch.mono = mono;
  batch.wall = wall;
  batch.sample = last_;
  st_.ring.push(batch);
  return true;
}

std::vector<psistat::model::Event> TickScheduler::detect_events(steady_clock::time_point mono,
                                                                system_clock::time_point wall) {
  auto events = detector_.detect(st_.ring, st_.threshold.value(), st_.event_lag, mono, wall);
  // Back to front so the first series detected ends up newest
  for (auto it = events.rbegin(); it != events.rend(); ++it) st_.history.insert(*it);
  return events;
}

bool TickScheduler::tick_at(steady_clock::time_point mono, system_clock::time_point wall) {
  phase_ = Phase::Sampling;
  if (!sample_once(mono, wall)) return false;
  phase_ = Phase::Rendering;
  (void)detect_events(mono, wall);
  ++st_.ticks;
  return true;
}

void TickScheduler::render(steady_clock::time_point now) {
  phase_ = Phase::Rendering;
  renderer_.render(surface_, st_, now);
}

void TickScheduler::dump_history() {
  std::ostream& out = opts_.dump_out ? *opts_.dump_out : std::cout;
  surface_.suspend();
  renderer_.dump_history(out, st_.history, steady_clock::now());
  if (opts_.dump_waits_for_key) {
    out << "press any key to continue" << std::flush;
    while (!stopped()) {
      if (!keys_.read_keys(milliseconds(250)).empty()) break;
    }
    out << '\n';
  }
  surface_.resume();
}

bool TickScheduler::dispatch(ControlAction a) {
  switch (a) {
    case ControlAction::Quit: return false;
    case ControlAction::ThresholdUp: st_.threshold.raise(); break;
    case ControlAction::ThresholdDown: st_.threshold.lower(); break;
    case ControlAction::CycleInterval: st_.event_lag = next_event_lag(st_.event_lag); break;
    case ControlAction::ToggleBrief: st_.brief = !st_.brief; break;
    case ControlAction::DumpHistory: dump_history(); break;
    case ControlAction::ToggleHelp: st_.show_help = !st_.show_help; break;
  }
  return true;
}

bool TickScheduler::handle_keys(const std::vector<char>& keys) {
  bool changed = false;
  for (char c : keys) {
    auto it = opts_.keymap.find(c);
    if (it == opts_.keymap.end()) continue;
    if (!dispatch(it->second)) return false;
    changed = true;
  }
  if (changed) render(steady_clock::now());
  return true;
}

bool TickScheduler::await_input(steady_clock::time_point deadline) {
  phase_ = Phase::AwaitingInput;
  while (!stopped()) {
    auto now = steady_clock::now();
    if (now >= deadline) return true;
    auto wait = std::chrono::ceil<milliseconds>(deadline - now);
    if (!handle_keys(keys_.read_keys(wait))) return false;
    phase_ = Phase::AwaitingInput;
  }
  return false;
}

int TickScheduler::run() {
  auto deadline = steady_clock::now();
  while (!stopped()) {
    if (!tick_at(steady_clock::now(), system_clock::now())) {
      phase_ = Phase::Terminating;
      return 1;
    }
    render(steady_clock::now());
    if (opts_.max_ticks && st_.ticks >= opts_.max_ticks) break;
    deadline = advance_deadline(deadline, opts_.period, steady_clock::now());
    if (!await_input(deadline)) break;
  }
  phase_ = Phase::Terminating;
  return 0;
}

} // namespace psistat::app
