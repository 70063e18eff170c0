#include "app/Control.hpp"
#include <cctype>

namespace psistat::app {

const char* action_name(ControlAction a) {
  switch (a) {
    case ControlAction::Quit: return "quit";
    case ControlAction::ThresholdUp: return "threshold_up";
    case ControlAction::ThresholdDown: return "threshold_down";
    case ControlAction::CycleInterval: return "cycle_interval";
    case ControlAction::ToggleBrief: return "toggle_brief";
    case ControlAction::DumpHistory: return "dump";
    case ControlAction::ToggleHelp: return "help";
  }
  return "?";
}

KeyMap default_keymap() {
  return KeyMap{
    {'q', ControlAction::Quit},
    {'Q', ControlAction::Quit},
    {'T', ControlAction::ThresholdUp},
    {'t', ControlAction::ThresholdDown},
    {'i', ControlAction::CycleInterval},
    {'b', ControlAction::ToggleBrief},
    {'d', ControlAction::DumpHistory},
    {'?', ControlAction::ToggleHelp},
  };
}

char key_for(const KeyMap& km, ControlAction a) {
  // Lowercase first, then lowest code, so the legend is stable across runs.
  auto rank = [](char c) { return std::islower(static_cast<unsigned char>(c)) ? 0 : 1; };
  char best = 0;
  for (const auto& [k, v] : km) {
    if (v != a) continue;
    if (best == 0 || rank(k) < rank(best) || (rank(k) == rank(best) && k < best)) best = k;
  }
  return best;
}

} // namespace psistat::app
