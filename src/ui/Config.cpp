#include "ui/Config.hpp"
#include "app/Threshold.hpp"
#include "ui/Terminal.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <string>

namespace psistat::ui {

bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b) {
  if (hex.size() != 7 || hex[0] != '#') return false;
  unsigned rgb[3];
  for (int i = 0; i < 3; ++i) {
    const char* first = hex.data() + 1 + 2 * i;
    auto [ptr, ec] = std::from_chars(first, first + 2, rgb[i], 16);
    if (ec != std::errc() || ptr != first + 2) return false;
  }
  r = static_cast<int>(rgb[0]);
  g = static_cast<int>(rgb[1]);
  b = static_cast<int>(rgb[2]);
  return true;
}

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("PSISTAT_", 0) == 0) {
    alt = std::string("psistat_") + n.substr(8);
  } else if (n.rfind("psistat_", 0) == 0) {
    alt = std::string("PSISTAT_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  int parsed = 0;
  const char* last = v + std::strlen(v);
  auto [ptr, ec] = std::from_chars(v, last, parsed);
  // Junk, trailing text and anything outside int all keep the default
  if (ec != std::errc() || ptr != last) return defv;
  return parsed;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/psistat/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/psistat/config.toml";
  return {};
}

// Resolve a color role from TOML -> compiled default.
// TOML value can be integer (palette index) or "#RRGGBB" (hex override).
static std::string resolve_color(const psistat::util::TomlReader& toml, bool have_toml,
                                 const char* role, int def_palette_idx,
                                 const char* def_hex) {
  if (have_toml && toml.has("roles", role)) {
    std::string val = toml.get_string("roles", role);
    if (!val.empty() && std::isdigit(static_cast<unsigned char>(val[0]))) {
      int idx = toml.get_int("roles", role, def_palette_idx);
      return role_palette(idx);
    }
    int r, g, b;
    if (parse_hex_rgb(val, r, g, b)) {
      if (truecolor_capable()) return role_rgb(r, g, b);
    } else {
      std::fprintf(stderr, "psistat: config: ignoring [roles] %s = \"%s\"\n", role, val.c_str());
    }
  }
  if (def_hex && truecolor_capable()) {
    int r, g, b;
    if (parse_hex_rgb(std::string(def_hex), r, g, b)) return role_rgb(r, g, b);
  }
  return role_palette(def_palette_idx);
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const psistat::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const psistat::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const psistat::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

using psistat::app::ControlAction;

// Default keybind table; [keybinds] entries are keyed by action_name().
struct KeybindDef { char key; ControlAction action; };
static constexpr KeybindDef default_keybinds[] = {
  {'q', ControlAction::Quit},
  {'T', ControlAction::ThresholdUp},
  {'t', ControlAction::ThresholdDown},
  {'i', ControlAction::CycleInterval},
  {'b', ControlAction::ToggleBrief},
  {'d', ControlAction::DumpHistory},
  {'?', ControlAction::ToggleHelp},
};

static void populate_keybinds(Config& c, const psistat::util::TomlReader& toml, bool have_toml) {
  c.keybinds.clear();
  for (const auto& kb : default_keybinds) {
    char key = kb.key;
    const char* name = psistat::app::action_name(kb.action);
    if (have_toml && toml.has("keybinds", name)) {
      std::string val = toml.get_string("keybinds", name);
      if (val.size() == 1) key = val[0];
      else std::fprintf(stderr, "psistat: config: [keybinds] %s must be one character\n", name);
    }
    c.keybinds[key] = kb.action;
  }
  // Upper-case Q quits too unless it was given another job
  if (c.keybinds.find('Q') == c.keybinds.end() && c.keybinds.count('q') && c.keybinds['q'] == ControlAction::Quit)
    c.keybinds['Q'] = ControlAction::Quit;
}

Config build_config(const psistat::util::TomlReader& toml, bool have_toml) {
  Config c{};

  // --- [roles] ---
  c.colors.accent  = resolve_color(toml, have_toml, "accent",  11, nullptr);
  c.colors.warning = resolve_color(toml, have_toml, "warning",  1, nullptr);
  c.colors.muted   = resolve_color(toml, have_toml, "muted",    8, "#787878");

  // --- [thresholds] ---
  c.thresholds.threshold_pct = psistat::app::Threshold::normalize(
      resolve_int(toml, have_toml, "thresholds", "threshold_pct", "PSISTAT_THRESHOLD_PCT",
                  psistat::app::Threshold::kDefault));

  // --- [sampling] ---
  c.sampling.period_ms = std::clamp(
      resolve_int(toml, have_toml, "sampling", "period_ms", "PSISTAT_PERIOD_MS", 1000),
      kMinPeriodMs, kMaxPeriodMs);

  // --- [ui] ---
  c.ui.alt_screen  = resolve_bool(toml, have_toml, "ui", "alt_screen",  "PSISTAT_ALT_SCREEN", true);
  c.ui.time_format = resolve_string(toml, have_toml, "ui", "time_format", "PSISTAT_TIME_FORMAT", "%H:%M:%S");

  // --- [keybinds] ---
  populate_keybinds(c, toml, have_toml);

  return c;
}

const Config& config() {
  static Config cfg = []{
    psistat::util::TomlReader toml;
    auto path = config_file_path();
    bool have_toml = !path.empty() && toml.load(path);
    if (have_toml && toml.skipped_lines() > 0) {
      std::fprintf(stderr, "psistat: config: skipped %d unreadable line(s) in %s\n",
                   toml.skipped_lines(), path.c_str());
    }
    return build_config(toml, have_toml);
  }();
  return cfg;
}

const UIConfig& ui_config() {
  static UIConfig uic = []{
    const auto& c = config();
    return UIConfig{c.colors.accent, c.colors.warning, c.colors.muted};
  }();
  return uic;
}

} // namespace psistat::ui
