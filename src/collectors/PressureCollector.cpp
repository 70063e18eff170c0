#include "collectors/PressureCollector.hpp"
#include "util/Churn.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <cstdio>
#include <cstdlib>

using psistat::model::CounterSample;
using psistat::model::Resource;
using psistat::model::StallKind;

namespace psistat::collectors {

const char* parse_status_name(ParseStatus s) {
  switch (s) {
    case ParseStatus::Ok: return "ok";
    case ParseStatus::Empty: return "empty";
    case ParseStatus::UnknownKind: return "unknown kind";
    case ParseStatus::BadField: return "bad field";
    case ParseStatus::BadNumber: return "bad number";
    case ParseStatus::MissingTotal: return "missing total";
  }
  return "?";
}

static bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r'; }

// Split off the next whitespace-delimited token; empty when exhausted.
static std::string_view next_token(std::string_view& rest) {
  while (!rest.empty() && is_blank(rest.front())) rest.remove_prefix(1);
  size_t end = 0;
  while (end < rest.size() && !is_blank(rest[end])) ++end;
  auto tok = rest.substr(0, end);
  rest.remove_prefix(end);
  return tok;
}

static bool parse_u64(std::string_view sv, uint64_t& v) {
  if (sv.empty()) return false;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
  return ec == std::errc() && ptr == sv.data() + sv.size();
}

static bool parse_double(std::string_view sv, double& v) {
  if (sv.empty()) return false;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
  return ec == std::errc() && ptr == sv.data() + sv.size() && v >= 0.0;
}

ParseStatus parse_pressure_line(std::string_view line, PressureLine& out) {
  std::string_view rest = line;
  auto kind = next_token(rest);
  if (kind.empty()) return ParseStatus::Empty;
  PressureLine parsed{};
  if (kind == "some") parsed.kind = StallKind::Some;
  else if (kind == "full") parsed.kind = StallKind::Full;
  else return ParseStatus::UnknownKind;

  bool last_was_total = false;
  for (auto tok = next_token(rest); !tok.empty(); tok = next_token(rest)) {
    auto eq = tok.find('=');
    if (eq == std::string_view::npos || eq == 0 || eq + 1 == tok.size()) return ParseStatus::BadField;
    auto key = tok.substr(0, eq);
    auto val = tok.substr(eq + 1);
    last_was_total = false;
    if (key == "total") {
      if (!parse_u64(val, parsed.total_us)) return ParseStatus::BadNumber;
      last_was_total = true;
    } else if (key == "avg10") {
      if (!parse_double(val, parsed.avgs.avg10)) return ParseStatus::BadNumber;
    } else if (key == "avg60") {
      if (!parse_double(val, parsed.avgs.avg60)) return ParseStatus::BadNumber;
    } else if (key == "avg300") {
      if (!parse_double(val, parsed.avgs.avg300)) return ParseStatus::BadNumber;
    }
  }
  if (!last_was_total) return ParseStatus::MissingTotal;
  out = parsed;
  return ParseStatus::Ok;
}

PressureCollector::PressureCollector() {
  const char* v = std::getenv("PSISTAT_DEBUG_RAW");
  debug_raw_ = v && *v == '1';
}

std::string PressureCollector::record_path(Resource r) {
  return std::string("/proc/pressure/") + psistat::model::resource_name(r);
}

bool PressureCollector::init() {
  for (auto r : psistat::model::kResources) {
    std::string why;
    if (!psistat::util::probe_readable(record_path(r), why)) {
      error_ = "cannot read " + record_path(r) + ": " + why;
      return false;
    }
  }
  error_.clear();
  return true;
}

void PressureCollector::apply_record(Resource r, std::string_view text, CounterSample& out) {
  bool seen[psistat::model::kKindCount]{};
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    std::string_view line = text.substr(start, end - start);
    start = end + 1;
    if (debug_raw_) {
      std::fprintf(stderr, "DB: %s %.*s\n", psistat::model::resource_name(r),
                   static_cast<int>(line.size()), line.data());
    }
    PressureLine pl{};
    auto st = parse_pressure_line(line, pl);
    if (st == ParseStatus::Empty) continue;
    if (st != ParseStatus::Ok) {
      psistat::util::note_churn(psistat::util::ChurnKind::Parse);
      if (debug_raw_) {
        std::fprintf(stderr, "DB: %s line skipped (%s)\n", psistat::model::resource_name(r), parse_status_name(st));
      }
      continue;
    }
    auto k = static_cast<size_t>(pl.kind);
    if (seen[k]) continue; // first line of a kind wins
    seen[k] = true;
    auto& rd = out.at(r, pl.kind);
    rd.resource = r;
    rd.kind = pl.kind;
    rd.total_us = pl.total_us;
    rd.avgs = pl.avgs;
    rd.batch_seq = seq_;
    rd.valid = true;
  }
}

bool PressureCollector::sample(CounterSample& out) {
  ++seq_;
  for (auto r : psistat::model::kResources) {
    auto txt = psistat::util::read_file_string(record_path(r));
    if (!txt) {
      error_ = "cannot read " + record_path(r);
      return false;
    }
    apply_record(r, *txt, out);
  }
  return true;
}

} // namespace psistat::collectors
