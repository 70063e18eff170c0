#pragma once
#include "model/Pressure.hpp"
#include <string>

namespace psistat::collectors {

// Source of cumulative stall counters. The scheduler only talks to this,
// so tests can feed scripted values instead of /proc/pressure.
class ICounterSource {
public:
  virtual ~ICounterSource() = default;

  // Open/validate the underlying records. Return false if unavailable;
  // error() then describes why.
  [[nodiscard]] virtual bool init() { return true; }

  // Fill 'out' with the current cumulative readings. Series whose line was
  // malformed keep the value they had in 'out' before the call. Return false
  // only when a record could not be read at all.
  [[nodiscard]] virtual bool sample(psistat::model::CounterSample& out) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
  [[nodiscard]] virtual std::string error() const { return {}; }
};

} // namespace psistat::collectors
