#pragma once
#include "collectors/ICounterSource.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace psistat::collectors {

// Outcome of tokenising one /proc/pressure line.
enum class ParseStatus { Ok, Empty, UnknownKind, BadField, BadNumber, MissingTotal };

const char* parse_status_name(ParseStatus s);

struct PressureLine {
  psistat::model::StallKind kind{psistat::model::StallKind::Some};
  psistat::model::KernelAverages avgs{};
  uint64_t total_us{};
};

// "some avg10=0.12 avg60=0.05 avg300=0.01 total=123456"
// The kind comes first, every other token is key=value and the last one
// must be total=<unsigned>. Unknown keys are accepted and ignored.
[[nodiscard]] ParseStatus parse_pressure_line(std::string_view line, PressureLine& out);

// Reads /proc/pressure/{cpu,io,memory}; each record is re-read in full on
// every sample.
class PressureCollector : public ICounterSource {
public:
  PressureCollector();
  [[nodiscard]] bool init() override;
  [[nodiscard]] bool sample(psistat::model::CounterSample& out) override;
  [[nodiscard]] const char* name() const override { return "/proc/pressure"; }
  [[nodiscard]] std::string error() const override { return error_; }

  [[nodiscard]] static std::string record_path(psistat::model::Resource r);

private:
  void apply_record(psistat::model::Resource r, std::string_view text, psistat::model::CounterSample& out);

  std::string error_;
  uint64_t seq_{0};
  bool debug_raw_{false};
};

} // namespace psistat::collectors
