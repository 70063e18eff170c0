#include "minitest.hpp"
#include "fakes.hpp"
#include "app/TickScheduler.hpp"
#include "ui/Renderer.hpp"
#include "ui/Surface.hpp"
#include <algorithm>
#include <sstream>

using namespace std::chrono;
using psistat::app::ControlAction;
using psistat::app::SchedulerOptions;
using psistat::app::TickScheduler;
using psistat::ui::BufferSurface;
using psistat::ui::Renderer;
using psistat_test::ScriptedKeys;
using psistat_test::ScriptedSource;

static const steady_clock::time_point kT0 = steady_clock::time_point{} + hours(2);
static const system_clock::time_point kW0 = system_clock::time_point{} + seconds(1700000000);

static bool contains(const std::string& hay, const std::string& needle) {
  return hay.find(needle) != std::string::npos;
}

// Three ticks one second apart: cpu.some at 10% then 30%, threshold 5.
struct Fixture {
  ScriptedSource src{{0, 100000, 400000}};
  ScriptedKeys keys;
  Renderer renderer;
  BufferSurface surface{30, 140};
  TickScheduler sched;

  Fixture() : sched(src, surface, keys, renderer, options()) {
    for (int i = 0; i < 3; ++i) (void)sched.tick_at(kT0 + seconds(i), kW0 + seconds(i));
  }
  static SchedulerOptions options() {
    SchedulerOptions o;
    o.initial_threshold = 5;
    return o;
  }
};

TEST(renderer_header_shows_controls) {
  Fixture f;
  auto h = f.renderer.header_line(f.sched.state());
  ASSERT_EQ(h.rfind("PSISTAT | [tT]thresh=5% [i]tvl=1", 0), 0u);
  ASSERT_TRUE(contains(h, "[d]ump"));
  ASSERT_TRUE(contains(h, "[b]rief"));
  ASSERT_TRUE(contains(h, "?:help"));
  ASSERT_TRUE(contains(h, "q:quit"));
  ASSERT_TRUE(contains(h, "@1000ms"));
}

TEST(renderer_header_follows_keymap) {
  Fixture f;
  auto km = psistat::app::default_keymap();
  km.erase('q');
  km.erase('Q');
  km['x'] = ControlAction::Quit;
  Renderer r(km);
  ASSERT_TRUE(contains(r.header_line(f.sched.state()), "x:quit"));
}

TEST(renderer_table_rows) {
  Fixture f;
  auto t = f.renderer.table_lines(f.sched.state());
  ASSERT_EQ(t.size(), 4u);
  ASSERT_TRUE(contains(t[0], "Full.Stall%"));
  ASSERT_TRUE(contains(t[0], "Some.Stall%"));
  ASSERT_TRUE(contains(t[0], "---1s"));
  ASSERT_TRUE(contains(t[0], "-300s"));
  ASSERT_TRUE(contains(t[1], "cpu.full"));
  ASSERT_TRUE(contains(t[1], "cpu.some"));
  ASSERT_TRUE(t[1].find("cpu.full") < t[1].find("cpu.some"));
  ASSERT_TRUE(contains(t[2], "io.some"));
  ASSERT_TRUE(contains(t[3], "memory.some"));
  // three samples: the 10-step rate is not defined yet
  ASSERT_TRUE(contains(t[1], "n/a"));
  // cpu.some 1-step is 30%, 3-step is undefined
  ASSERT_TRUE(contains(t[1], " 30.0"));
}

TEST(renderer_table_without_samples_is_all_na) {
  psistat::app::DashboardState st;
  Renderer r;
  auto t = r.table_lines(st);
  ASSERT_TRUE(contains(t[1], "   n/a   n/a   n/a   n/a   n/a  cpu.full"));
}

TEST(renderer_frame_layout) {
  Fixture f;
  f.sched.render(kT0 + seconds(2));
  const auto& s = f.surface;
  ASSERT_EQ(s.line(0).rfind("PSISTAT |", 0), 0u);
  ASSERT_TRUE(contains(s.line(1), "Full.Stall%"));
  ASSERT_TRUE(contains(s.line(2), "cpu.some"));
  ASSERT_EQ(s.line(5).substr(0, 10), std::string(10, '-'));
  ASSERT_TRUE(contains(s.line(6), "cpu.some  30.000   >=5 i=1"));
  ASSERT_TRUE(contains(s.line(7), "cpu.some  10.000   >=5 i=1"));
  ASSERT_EQ(s.line(8), std::string());
}

TEST(renderer_brief_mode_hides_table) {
  Fixture f;
  (void)f.sched.dispatch(ControlAction::ToggleBrief);
  f.sched.render(kT0 + seconds(2));
  ASSERT_TRUE(contains(f.surface.line(1), "cpu.some  30.000"));
  ASSERT_TRUE(contains(f.surface.line(2), "cpu.some  10.000"));
}

TEST(renderer_help_screen) {
  Fixture f;
  (void)f.sched.dispatch(ControlAction::ToggleHelp);
  f.sched.render(kT0 + seconds(2));
  ASSERT_EQ(f.surface.line(1).rfind("Keys:", 0), 0u);
  bool saw_quit = false;
  for (int r = 2; r < f.surface.rows(); ++r) saw_quit = saw_quit || contains(f.surface.line(r), "q - quit");
  ASSERT_TRUE(saw_quit);
}

TEST(renderer_stops_at_last_row) {
  Fixture f;
  BufferSurface tiny(3, 140);
  f.renderer.render(tiny, f.sched.state(), kT0 + seconds(2));
  ASSERT_EQ(tiny.lines().size(), 3u);
  ASSERT_TRUE(contains(tiny.line(2), "cpu."));
}

TEST(renderer_clips_narrow_surface) {
  Fixture f;
  BufferSurface narrow(20, 12);
  f.renderer.render(narrow, f.sched.state(), kT0 + seconds(2));
  for (const auto& ln : narrow.lines()) ASSERT_TRUE(ln.size() <= 12u);
  ASSERT_EQ(narrow.line(0), std::string("PSISTAT | [t"));
}

TEST(renderer_event_line_format) {
  psistat::model::Event e{};
  e.mono = kT0;
  e.wall = kW0;
  e.resource = psistat::model::Resource::Memory;
  e.kind = psistat::model::StallKind::Full;
  e.pct = 12.3456;
  e.threshold = 10;
  e.lag = 3;
  auto ln = Renderer::event_line(e, kT0 + seconds(65));
  ASSERT_EQ(ln.rfind("  1m5s: ", 0), 0u);
  ASSERT_TRUE(contains(ln, " memory.full  12.346   >=10 i=3"));
  // MM-DD HH:MM:SS.mmm
  ASSERT_EQ(ln.substr(8, 18).size(), 18u);
  ASSERT_EQ(ln[10], '-');
  ASSERT_EQ(ln[22], '.');
}

TEST(renderer_dump_history_lists_every_event) {
  Fixture f;
  std::ostringstream os;
  f.renderer.dump_history(os, f.sched.state().history, kT0 + seconds(2));
  auto text = os.str();
  ASSERT_EQ(text.rfind("psistat: 2 event(s), newest first\n", 0), 0u);
  auto p30 = text.find("30.000");
  auto p10 = text.find("10.000");
  ASSERT_TRUE(p30 != std::string::npos && p10 != std::string::npos);
  ASSERT_TRUE(p30 < p10);
}

TEST(renderer_debug_stream_keeps_whole_table) {
  Fixture f;
  int width = f.renderer.table_width();
  ASSERT_EQ(width, 91);
  std::ostringstream os;
  psistat::ui::StreamSurface stream(os, std::max(80, width));
  f.renderer.render(stream, f.sched.state(), kT0 + seconds(2));
  auto text = os.str();
  ASSERT_TRUE(contains(text, "Some.Stall%"));
  ASSERT_TRUE(contains(text, "cpu.some"));
  ASSERT_TRUE(contains(text, "memory.some"));
}

TEST(terminal_session_suspend_and_resume) {
  // Tracked whether or not a tty is attached
  psistat::ui::TerminalSession session(false);
  ASSERT_FALSE(session.suspended());
  session.suspend();
  session.suspend();
  ASSERT_TRUE(session.suspended());
  session.resume();
  ASSERT_FALSE(session.suspended());
}
