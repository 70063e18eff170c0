#pragma once
#include <unordered_map>

namespace psistat::app {

// Everything a keystroke can ask the dashboard to do.
enum class ControlAction {
  Quit,
  ThresholdUp,
  ThresholdDown,
  CycleInterval,
  ToggleBrief,
  DumpHistory,
  ToggleHelp,
};

using KeyMap = std::unordered_map<char, ControlAction>;

[[nodiscard]] const char* action_name(ControlAction a);

// q quit, T/t threshold up/down, i interval, b brief, d dump, ? help
[[nodiscard]] KeyMap default_keymap();

// First key bound to 'a', or 0 if unbound.
[[nodiscard]] char key_for(const KeyMap& km, ControlAction a);

} // namespace psistat::app
