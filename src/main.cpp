#include "app/Cli.hpp"
#include "app/TickScheduler.hpp"
#include "collectors/PressureCollector.hpp"
#include "ui/Config.hpp"
#include "ui/Input.hpp"
#include "ui/Renderer.hpp"
#include "ui/Surface.hpp"
#include "ui/Terminal.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  using namespace psistat;

  app::CliOptions cli;
  std::string usage_error;
  if (!app::parse_cli(std::vector<std::string>(argv + 1, argv + argc), cli, usage_error)) {
    std::fprintf(stderr, "psistat: %s\n", usage_error.c_str());
    app::print_usage(stderr);
    return app::kExitUsage;
  }
  if (cli.help) {
    app::print_usage(stdout);
    return app::kExitOk;
  }

  const auto& cfg = ui::config();
  app::SchedulerOptions opts = app::resolve_options(cli, cfg);
  opts.stop_flag = &ui::g_stop;

  collectors::PressureCollector source;
  if (!source.init()) {
    std::fprintf(stderr, "psistat: %s\n", source.error().c_str());
    return app::kExitFatal;
  }

  ui::Renderer renderer(cfg.keybinds, cfg.ui.time_format);
  ui::install_signal_handlers();

  std::string failure;
  app::EventHistory history;
  auto run_on = [&](ui::ITextSurface& surface, app::IKeySource& keys) {
    app::TickScheduler sched(source, surface, keys, renderer, opts);
    int code = sched.run();
    if (code != app::kExitOk) failure = sched.error();
    history = sched.state().history;
    return code;
  };

  if (!cli.debug) std::atexit(&ui::on_atexit_restore);
  // The surface lives inside the body, so the terminal is back to normal
  // before any failure is printed.
  int rc = app::run_catching_faults([&] {
    if (cli.debug) {
      // Never narrower than the rate table, so piped output keeps every column
      ui::StreamSurface surface(std::cout, std::max(ui::term_size().cols, renderer.table_width()));
      ui::SleepKeySource keys;
      return run_on(surface, keys);
    }
    ui::TerminalSurface surface(cfg.ui.alt_screen);
    ui::TerminalKeySource keys;
    return run_on(surface, keys);
  }, failure);

  if (rc != app::kExitOk) {
    std::fprintf(stderr, "psistat: %s\n", failure.c_str());
    return rc;
  }
  if (!history.empty()) renderer.dump_history(std::cout, history, std::chrono::steady_clock::now());
  return app::kExitOk;
}
