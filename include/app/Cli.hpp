#pragma once
#include "app/TickScheduler.hpp"
#include <cstdio>
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace psistat::ui { struct Config; }

namespace psistat::app {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFatal = 1;
inline constexpr int kExitUsage = 2;

// Options as given on the command line; unset values come from config.
struct CliOptions {
  std::optional<int> threshold_pct;
  std::optional<int> period_ms;
  int iterations{0};
  bool debug{false};
  bool help{false};
};

// 'args' excludes argv[0]. Returns false on bad usage with 'err' set; the
// caller exits with kExitUsage.
bool parse_cli(const std::vector<std::string>& args, CliOptions& out, std::string& err);

// Command line over config. A given threshold is normalized and a given
// period clamped, never ignored.
[[nodiscard]] SchedulerOptions resolve_options(const CliOptions& cli, const psistat::ui::Config& cfg);

void print_usage(std::FILE* to);

// Runs 'body' and returns its exit code. Anything it throws becomes
// kExitFatal with the reason in 'failure'; locals of 'body' have unwound by
// the time this returns.
template <class Body>
int run_catching_faults(Body&& body, std::string& failure) {
  try {
    return body();
  } catch (const std::exception& e) {
    failure = e.what();
  } catch (...) {
    failure = "unexpected fault";
  }
  return kExitFatal;
}

} // namespace psistat::app
