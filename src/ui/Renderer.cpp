#include "ui/Renderer.hpp"
#include "app/Rate.hpp"
#include "ui/Formatting.hpp"
#include "util/Churn.hpp"
#include <algorithm>
#include <cstdio>
#include <ostream>
#include <utility>

using psistat::app::ControlAction;
using psistat::model::StallKind;

namespace psistat::ui {

static constexpr int kPctWidth = 5;
static constexpr int kSeriesWidth = 11;
static constexpr const char* kKindGap = "     ";

Renderer::Renderer(psistat::app::KeyMap keys, std::string time_format)
    : keys_(std::move(keys)), time_format_(std::move(time_format)) {}

std::string Renderer::key_label(ControlAction a) const {
  char k = psistat::app::key_for(keys_, a);
  return k ? std::string(1, k) : std::string("-");
}

std::string Renderer::header_line(const psistat::app::DashboardState& st) const {
  std::string thr_keys = key_label(ControlAction::ThresholdDown) + key_label(ControlAction::ThresholdUp);
  std::string out = "PSISTAT | [" + thr_keys + "]thresh=" + std::to_string(st.threshold.value()) + "%"
                  + " [" + key_label(ControlAction::CycleInterval) + "]tvl=" + std::to_string(st.event_lag)
                  + " [" + key_label(ControlAction::DumpHistory) + "]ump"
                  + " [" + key_label(ControlAction::ToggleBrief) + "]rief"
                  + " " + key_label(ControlAction::ToggleHelp) + ":help"
                  + " " + key_label(ControlAction::Quit) + ":quit"
                  + " @" + std::to_string(st.period.count()) + "ms";
  return out;
}

// One half of a table row: five rate cells then the series name.
static std::string kind_cells(const psistat::app::DashboardState& st, psistat::model::Resource r, StallKind k) {
  std::string out;
  for (auto lag : psistat::app::kRateLags) {
    auto pct = psistat::app::rate(st.ring, r, k, lag);
    out += ' ';
    out += pct ? fmt_pct(*pct, kPctWidth, 1) : rpad_trunc("n/a", kPctWidth);
  }
  const psistat::model::Reading* rd = st.ring.empty() ? nullptr : &st.ring.newest().reading(r, k);
  bool have_avgs = rd && rd->valid;
  out += ' ';
  out += have_avgs ? fmt_pct(rd->avgs.avg60, kPctWidth, 1) : rpad_trunc("n/a", kPctWidth);
  out += ' ';
  out += have_avgs ? fmt_pct(rd->avgs.avg300, kPctWidth, 1) : rpad_trunc("n/a", kPctWidth);
  out += "  " + clip_pad(psistat::model::series_name(r, k), kSeriesWidth);
  return out;
}

std::vector<std::string> Renderer::table_lines(const psistat::app::DashboardState& st) const {
  std::string cols;
  for (const char* w : {"1s", "3s", "10s", "60s", "300s"}) {
    std::string label = w;
    cols += ' ' + std::string(std::max(0, kPctWidth - (int)label.size()), '-') + label;
  }
  std::vector<std::string> out;
  out.push_back(cols + "  " + clip_pad("Full.Stall%", kSeriesWidth) + kKindGap + cols + "  " + "Some.Stall%");
  for (auto r : psistat::model::kResources) {
    out.push_back(kind_cells(st, r, StallKind::Full) + kKindGap + kind_cells(st, r, StallKind::Some));
  }
  return out;
}

int Renderer::table_width() const {
  int w = 0;
  for (const auto& ln : table_lines(psistat::app::DashboardState{})) w = std::max(w, display_cols(ln));
  return w;
}

std::vector<std::string> Renderer::help_lines() const {
  std::vector<std::string> out;
  out.push_back("Keys:");
  auto add = [&](ControlAction a, const char* what) {
    out.push_back("   " + key_label(a) + " - " + what);
  };
  add(ControlAction::ThresholdDown, "lower event threshold by 5% (floor 5%)");
  add(ControlAction::ThresholdUp, "raise event threshold by 5% (ceiling 95%)");
  add(ControlAction::CycleInterval, "cycle event window (1, 3, 10 samples)");
  add(ControlAction::ToggleBrief, "toggle brief mode (events only)");
  add(ControlAction::DumpHistory, "dump the full event history");
  add(ControlAction::ToggleHelp, "toggle this help");
  add(ControlAction::Quit, "quit");
  out.push_back("   CTRL-c - quit");
  return out;
}

std::string Renderer::event_line(const psistat::model::Event& e, std::chrono::steady_clock::time_point now) {
  double age = std::chrono::duration<double>(now - e.mono).count();
  char buf[160];
  std::snprintf(buf, sizeof(buf), "%6s: %s %11s %7.3f   >=%d i=%zu",
                compact_duration(age).c_str(),
                format_event_time(e.wall).c_str(),
                psistat::model::series_name(e.resource, e.kind).c_str(),
                e.pct, e.threshold, e.lag);
  return std::string(buf);
}

void Renderer::render(ITextSurface& surface, const psistat::app::DashboardState& st,
                      std::chrono::steady_clock::time_point now) const {
  surface.begin_frame();
  const int rows = surface.rows();
  const int cols = surface.cols();
  int row = 0;

  auto header = header_line(st);
  surface.put(row, 0, header, -1, Highlight::Header);
  std::string right = format_time_now(time_format_);
  int skipped = psistat::util::count_recent_kind_ms(psistat::util::ChurnKind::Parse, 60000);
  if (skipped > 0) right = "skipped:" + std::to_string(skipped) + "  " + right;
  int rw = display_cols(right);
  if (rw > 0 && cols - rw > display_cols(header) + 1) {
    surface.put(row, cols - rw, right, rw, skipped > 0 ? Highlight::Warn : Highlight::Header, Align::Right);
  }
  ++row;

  if (st.show_help) {
    for (const auto& ln : help_lines()) surface.put(row++, 0, ln);
    surface.end_frame();
    return;
  }

  if (!st.brief) {
    auto table = table_lines(st);
    for (size_t i = 0; i < table.size(); ++i) {
      surface.put(row++, 0, table[i], -1, i == 0 ? Highlight::Muted : Highlight::None);
    }
    surface.put(row++, 0, std::string(static_cast<size_t>(std::max(0, cols)), '-'), -1, Highlight::Muted);
  }

  // Events from the latest tick stand out
  auto latest = st.history.empty() ? now : st.history.view().front().mono;
  for (const auto& e : st.history.view()) {
    if (row >= rows) break;
    surface.put(row++, 0, event_line(e, now), -1, e.mono == latest ? Highlight::Warn : Highlight::None);
  }
  surface.end_frame();
}

void Renderer::dump_history(std::ostream& out, const psistat::app::EventHistory& history,
                            std::chrono::steady_clock::time_point now) const {
  out << "psistat: " << history.size() << " event(s), newest first\n";
  for (const auto& e : history.view()) out << event_line(e, now) << '\n';
  out.flush();
}

} // namespace psistat::ui
