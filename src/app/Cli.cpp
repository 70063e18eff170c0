#include "app/Cli.hpp"
#include "ui/Config.hpp"
#include <algorithm>
#include <stdexcept>

namespace psistat::app {

void print_usage(std::FILE* to) {
  std::fprintf(to,
    "Usage: psistat [-t|--threshold-pct N] [-p|--period-ms MS] [-n|--iterations N] [-D|--debug] [-h|--help]\n"
    "  -t, --threshold-pct N  event threshold in percent (multiple of 5, 5..95; default 20)\n"
    "  -p, --period-ms MS     sampling period (100..10000; default 1000)\n"
    "  -n, --iterations N     stop after N ticks (0 = until quit)\n"
    "  -D, --debug            plain text frames on stdout, no keyboard\n"
    "Keys: t/T threshold, i event window, b brief, d dump history, ? help, q quit\n");
}

// Strict integer: the whole argument must parse.
static int parse_int_arg(const std::string& v) {
  size_t used = 0;
  int out = std::stoi(v, &used);
  if (used != v.size()) throw std::invalid_argument(v);
  return out;
}

bool parse_cli(const std::vector<std::string>& args, CliOptions& out, std::string& err) {
  CliOptions o;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    bool takes_value = a == "-t" || a == "--threshold-pct" || a == "-p" || a == "--period-ms"
                    || a == "-n" || a == "--iterations";
    if (takes_value && i + 1 >= args.size()) {
      err = a + " needs a value";
      return false;
    }
    try {
      if (a == "-t" || a == "--threshold-pct") o.threshold_pct = parse_int_arg(args[++i]);
      else if (a == "-p" || a == "--period-ms") o.period_ms = parse_int_arg(args[++i]);
      else if (a == "-n" || a == "--iterations") o.iterations = parse_int_arg(args[++i]);
      else if (a == "-D" || a == "--debug") o.debug = true;
      else if (a == "-h" || a == "--help") o.help = true;
      else {
        err = "unknown option '" + a + "'";
        return false;
      }
    } catch (const std::invalid_argument&) {
      err = "bad value '" + args[i] + "' for " + a;
      return false;
    } catch (const std::out_of_range&) {
      err = "value out of range for " + a;
      return false;
    }
  }
  if (o.iterations < 0) {
    err = "--iterations must not be negative";
    return false;
  }
  out = o;
  return true;
}

SchedulerOptions resolve_options(const CliOptions& cli, const psistat::ui::Config& cfg) {
  SchedulerOptions opts;
  opts.initial_threshold = Threshold::normalize(cli.threshold_pct.value_or(cfg.thresholds.threshold_pct));
  int period_ms = std::clamp(cli.period_ms.value_or(cfg.sampling.period_ms),
                             psistat::ui::kMinPeriodMs, psistat::ui::kMaxPeriodMs);
  opts.period = std::chrono::milliseconds(period_ms);
  opts.max_ticks = static_cast<uint64_t>(cli.iterations);
  opts.keymap = cfg.keybinds;
  return opts;
}

} // namespace psistat::app
