#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <string>

namespace psistat::model {

enum class Resource { Cpu, Io, Memory };
enum class StallKind { Some, Full };

inline constexpr std::size_t kResourceCount = 3;
inline constexpr std::size_t kKindCount = 2;
inline constexpr std::size_t kSeriesCount = kResourceCount * kKindCount;

inline constexpr std::array<Resource, kResourceCount> kResources{Resource::Cpu, Resource::Io, Resource::Memory};
inline constexpr std::array<StallKind, kKindCount> kKinds{StallKind::Some, StallKind::Full};

const char* resource_name(Resource r);
const char* kind_name(StallKind k);
// "cpu.some", "memory.full", ...
std::string series_name(Resource r, StallKind k);

constexpr std::size_t series_index(Resource r, StallKind k) {
  return static_cast<std::size_t>(r) * kKindCount + static_cast<std::size_t>(k);
}

// Kernel-computed running averages, displayed as given.
struct KernelAverages {
  double avg10{};
  double avg60{};
  double avg300{};
};

// One cumulative counter value for one (resource, kind) series.
struct Reading {
  Resource resource{Resource::Cpu};
  StallKind kind{StallKind::Some};
  uint64_t total_us{};
  uint64_t batch_seq{};
  bool valid{false};     // false until the series has been parsed at least once
  KernelAverages avgs{};
};

// What a counter source fills in per sample; indexed by series_index().
struct CounterSample {
  std::array<Reading, kSeriesCount> readings{};

  Reading& at(Resource r, StallKind k) { return readings[series_index(r, k)]; }
  const Reading& at(Resource r, StallKind k) const { return readings[series_index(r, k)]; }
};

struct SampleBatch {
  uint64_t seq{};
  std::chrono::steady_clock::time_point mono{};
  std::chrono::system_clock::time_point wall{};
  CounterSample sample{};

  const Reading& reading(Resource r, StallKind k) const { return sample.at(r, k); }
};

struct Event {
  std::chrono::steady_clock::time_point mono{};
  std::chrono::system_clock::time_point wall{};
  Resource resource{Resource::Cpu};
  StallKind kind{StallKind::Some};
  double pct{};          // rounded to 3 decimals
  int threshold{};       // threshold in force at detection
  std::size_t lag{};     // samples back used for the rate
};

} // namespace psistat::model
