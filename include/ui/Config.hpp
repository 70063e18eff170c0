#pragma once

#include "app/Control.hpp"
#include <string>

namespace psistat::util { class TomlReader; }

namespace psistat::ui {

// Resolved colours (SGR strings; empty when stdout is not a tty)
struct UIConfig {
  std::string accent;
  std::string warning;
  std::string muted;
};

struct Config {
  struct Colors {
    std::string accent;
    std::string warning;
    std::string muted;
  } colors;

  struct Thresholds {
    int threshold_pct{20};
  } thresholds;

  struct Sampling {
    int period_ms{1000};
  } sampling;

  struct UI {
    bool alt_screen{true};
    std::string time_format{"%H:%M:%S"};
  } ui;

  psistat::app::KeyMap keybinds;
};

inline constexpr int kMinPeriodMs = 100;
inline constexpr int kMaxPeriodMs = 10000;

// Process-wide configuration, resolved once: TOML -> env -> compiled default
const Config& config();
const UIConfig& ui_config();

// Resolution step on its own, for callers that bring their own TOML
Config build_config(const psistat::util::TomlReader& toml, bool have_toml);

// $XDG_CONFIG_HOME/psistat/config.toml or ~/.config/psistat/config.toml
std::string config_file_path();

// Environment variable helpers
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b);

} // namespace psistat::ui
