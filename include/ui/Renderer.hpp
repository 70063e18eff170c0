#pragma once

#include "app/Control.hpp"
#include "app/Dashboard.hpp"
#include "model/Pressure.hpp"
#include "ui/Surface.hpp"
#include <chrono>
#include <iosfwd>
#include <string>
#include <vector>

namespace psistat::ui {

// Lays out one dashboard frame:
//   row 0      header (threshold, event lag, key legend, clock)
//   rows 1..5  rate table and separator (hidden in brief mode)
//   rest       event history, newest first, until the rows run out
class Renderer {
public:
  explicit Renderer(psistat::app::KeyMap keys = psistat::app::default_keymap(),
                    std::string time_format = "%H:%M:%S");

  void render(ITextSurface& surface, const psistat::app::DashboardState& st,
              std::chrono::steady_clock::time_point now) const;

  [[nodiscard]] std::string header_line(const psistat::app::DashboardState& st) const;
  [[nodiscard]] std::vector<std::string> table_lines(const psistat::app::DashboardState& st) const;
  [[nodiscard]] std::vector<std::string> help_lines() const;

  // Columns a rate table row needs to show both stall kinds in full.
  [[nodiscard]] int table_width() const;

  // "   12s: 05-14 09:30:01.250    cpu.some  30.000   >=20 i=1"
  [[nodiscard]] static std::string event_line(const psistat::model::Event& e,
                                              std::chrono::steady_clock::time_point now);

  // Every event, newest first, as plain lines.
  void dump_history(std::ostream& out, const psistat::app::EventHistory& history,
                    std::chrono::steady_clock::time_point now) const;

private:
  psistat::app::KeyMap keys_;
  std::string time_format_;

  [[nodiscard]] std::string key_label(psistat::app::ControlAction a) const;
};

} // namespace psistat::ui
