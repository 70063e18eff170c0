#include "minitest.hpp"
#include "collectors/PressureCollector.hpp"
#include "util/Churn.hpp"
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

using namespace std;
namespace fs = std::filesystem;
using psistat::collectors::ParseStatus;
using psistat::collectors::PressureLine;
using psistat::collectors::parse_pressure_line;
using psistat::model::Resource;
using psistat::model::StallKind;

static fs::path make_root(const char* tag) {
  auto root = fs::temp_directory_path() / fs::path(std::string("psistat_test_psi_") + tag) / fs::path(std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "proc/pressure");
  return root;
}

static void write_record(const fs::path& root, const char* tag, const std::string& body) {
  ofstream(root / "proc/pressure" / tag) << body;
}

static void write_all(const fs::path& root) {
  write_record(root, "cpu",
    "some avg10=1.50 avg60=0.75 avg300=0.25 total=1000\n"
    "full avg10=0.00 avg60=0.00 avg300=0.00 total=0\n");
  write_record(root, "io",
    "some avg10=0.00 avg60=0.00 avg300=0.00 total=2000\n"
    "full avg10=0.00 avg60=0.00 avg300=0.00 total=1500\n");
  write_record(root, "memory",
    "some avg10=0.00 avg60=0.00 avg300=0.00 total=30\n"
    "full avg10=0.00 avg60=0.00 avg300=0.00 total=10\n");
}

TEST(pressure_parse_full_line) {
  PressureLine pl{};
  ASSERT_EQ(parse_pressure_line("some avg10=0.12 avg60=0.05 avg300=0.01 total=123456", pl), ParseStatus::Ok);
  ASSERT_TRUE(pl.kind == StallKind::Some);
  ASSERT_EQ(pl.total_us, 123456u);
  ASSERT_NEAR(pl.avgs.avg10, 0.12, 1e-9);
  ASSERT_NEAR(pl.avgs.avg60, 0.05, 1e-9);
  ASSERT_NEAR(pl.avgs.avg300, 0.01, 1e-9);
}

TEST(pressure_parse_full_kind_and_extra_blanks) {
  PressureLine pl{};
  ASSERT_EQ(parse_pressure_line("full  avg10=0.00\tavg60=0.00 avg300=0.00 total=42\r", pl), ParseStatus::Ok);
  ASSERT_TRUE(pl.kind == StallKind::Full);
  ASSERT_EQ(pl.total_us, 42u);
}

TEST(pressure_parse_only_total_is_enough) {
  PressureLine pl{};
  ASSERT_EQ(parse_pressure_line("some total=7", pl), ParseStatus::Ok);
  ASSERT_EQ(pl.total_us, 7u);
}

TEST(pressure_parse_rejects_malformed_lines) {
  PressureLine pl{};
  pl.total_us = 99;
  ASSERT_EQ(parse_pressure_line("", pl), ParseStatus::Empty);
  ASSERT_EQ(parse_pressure_line("   ", pl), ParseStatus::Empty);
  ASSERT_EQ(parse_pressure_line("most avg10=0.00 total=1", pl), ParseStatus::UnknownKind);
  ASSERT_EQ(parse_pressure_line("some avg10 total=1", pl), ParseStatus::BadField);
  ASSERT_EQ(parse_pressure_line("some avg10= total=1", pl), ParseStatus::BadField);
  ASSERT_EQ(parse_pressure_line("some avg10=0.00 total=abc", pl), ParseStatus::BadNumber);
  ASSERT_EQ(parse_pressure_line("some avg10=0.00 total=-5", pl), ParseStatus::BadNumber);
  ASSERT_EQ(parse_pressure_line("some avg10=x total=5", pl), ParseStatus::BadNumber);
  ASSERT_EQ(parse_pressure_line("some avg10=0.00 avg60=0.00", pl), ParseStatus::MissingTotal);
  ASSERT_EQ(parse_pressure_line("some total=5 avg10=0.00", pl), ParseStatus::MissingTotal);
  // Failed parses leave the output alone
  ASSERT_EQ(pl.total_us, 99u);
}

TEST(pressure_status_names) {
  ASSERT_EQ(std::string(psistat::collectors::parse_status_name(ParseStatus::Ok)), "ok");
  ASSERT_EQ(std::string(psistat::collectors::parse_status_name(ParseStatus::MissingTotal)), "missing total");
}

TEST(pressure_collector_reads_all_records) {
  auto root = make_root("read");
  write_all(root);
  setenv("PSISTAT_PROC_ROOT", root.c_str(), 1);
  psistat::collectors::PressureCollector c;
  ASSERT_TRUE(c.init());
  psistat::model::CounterSample s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_TRUE(s.at(Resource::Cpu, StallKind::Some).valid);
  ASSERT_EQ(s.at(Resource::Cpu, StallKind::Some).total_us, 1000u);
  ASSERT_NEAR(s.at(Resource::Cpu, StallKind::Some).avgs.avg60, 0.75, 1e-9);
  ASSERT_EQ(s.at(Resource::Io, StallKind::Full).total_us, 1500u);
  ASSERT_EQ(s.at(Resource::Memory, StallKind::Some).total_us, 30u);
  ASSERT_TRUE(s.at(Resource::Memory, StallKind::Full).resource == Resource::Memory);
  ASSERT_TRUE(s.at(Resource::Memory, StallKind::Full).kind == StallKind::Full);
  unsetenv("PSISTAT_PROC_ROOT");
  fs::remove_all(root);
}

TEST(pressure_collector_init_reports_missing_record) {
  auto root = make_root("missing");
  write_record(root, "cpu", "some total=1\nfull total=0\n");
  write_record(root, "io", "some total=1\nfull total=0\n");
  setenv("PSISTAT_PROC_ROOT", root.c_str(), 1);
  psistat::collectors::PressureCollector c;
  ASSERT_FALSE(c.init());
  ASSERT_EQ(c.error().rfind("cannot read /proc/pressure/memory: ", 0), 0u);
  unsetenv("PSISTAT_PROC_ROOT");
  fs::remove_all(root);
}

TEST(pressure_collector_sample_fails_when_record_vanishes) {
  auto root = make_root("vanish");
  write_all(root);
  setenv("PSISTAT_PROC_ROOT", root.c_str(), 1);
  psistat::collectors::PressureCollector c;
  ASSERT_TRUE(c.init());
  fs::remove(root / "proc/pressure/io");
  psistat::model::CounterSample s{};
  ASSERT_FALSE(c.sample(s));
  ASSERT_EQ(c.error(), std::string("cannot read /proc/pressure/io"));
  unsetenv("PSISTAT_PROC_ROOT");
  fs::remove_all(root);
}

TEST(pressure_collector_malformed_line_keeps_previous_value) {
  auto root = make_root("malformed");
  write_all(root);
  setenv("PSISTAT_PROC_ROOT", root.c_str(), 1);
  psistat::util::reset_churn();
  psistat::collectors::PressureCollector c;
  ASSERT_TRUE(c.init());
  psistat::model::CounterSample s{};
  ASSERT_TRUE(c.sample(s));
  auto first_seq = s.at(Resource::Cpu, StallKind::Full).batch_seq;

  write_record(root, "cpu",
    "some avg10=0.00 avg60=0.00 avg300=0.00 total=oops\n"
    "full avg10=0.00 avg60=0.00 avg300=0.00 total=70\n");
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.at(Resource::Cpu, StallKind::Some).total_us, 1000u);
  ASSERT_TRUE(s.at(Resource::Cpu, StallKind::Some).valid);
  ASSERT_EQ(s.at(Resource::Cpu, StallKind::Some).batch_seq, first_seq);
  ASSERT_EQ(s.at(Resource::Cpu, StallKind::Full).total_us, 70u);
  ASSERT_TRUE(s.at(Resource::Cpu, StallKind::Full).batch_seq > first_seq);
  ASSERT_EQ(s.at(Resource::Io, StallKind::Some).total_us, 2000u);
  ASSERT_EQ(psistat::util::count_recent_kind_ms(psistat::util::ChurnKind::Parse, 60000), 1);
  unsetenv("PSISTAT_PROC_ROOT");
  fs::remove_all(root);
}

TEST(pressure_collector_first_line_of_a_kind_wins) {
  auto root = make_root("dup");
  write_all(root);
  write_record(root, "memory",
    "some total=5\n"
    "some total=500\n"
    "full total=1\n");
  setenv("PSISTAT_PROC_ROOT", root.c_str(), 1);
  psistat::collectors::PressureCollector c;
  ASSERT_TRUE(c.init());
  psistat::model::CounterSample s{};
  ASSERT_TRUE(c.sample(s));
  ASSERT_EQ(s.at(Resource::Memory, StallKind::Some).total_us, 5u);
  unsetenv("PSISTAT_PROC_ROOT");
  fs::remove_all(root);
}

TEST(pressure_record_paths) {
  ASSERT_EQ(psistat::collectors::PressureCollector::record_path(Resource::Cpu), std::string("/proc/pressure/cpu"));
  ASSERT_EQ(psistat::collectors::PressureCollector::record_path(Resource::Memory), std::string("/proc/pressure/memory"));
}
