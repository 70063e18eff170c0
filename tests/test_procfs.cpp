#include "minitest.hpp"
#include "util/Churn.hpp"
#include "util/Procfs.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

TEST(procfs_maps_proc_paths_under_root) {
  setenv("PSISTAT_PROC_ROOT", "/tmp/fakeroot", 1);
  ASSERT_EQ(psistat::util::map_proc_path("/proc/pressure/cpu"), std::string("/tmp/fakeroot/proc/pressure/cpu"));
  ASSERT_EQ(psistat::util::map_proc_path("/etc/hostname"), std::string("/etc/hostname"));
  unsetenv("PSISTAT_PROC_ROOT");
  ASSERT_EQ(psistat::util::map_proc_path("/proc/pressure/cpu"), std::string("/proc/pressure/cpu"));
}

TEST(procfs_read_and_readable_check) {
  auto root = fs::temp_directory_path() / fs::path("psistat_test_procfs") / fs::path(std::to_string(::getpid()));
  fs::create_directories(root / "proc/pressure");
  std::ofstream(root / "proc/pressure/io") << "some total=1\n";
  setenv("PSISTAT_PROC_ROOT", root.c_str(), 1);
  psistat::util::reset_churn();

  auto txt = psistat::util::read_file_string("/proc/pressure/io");
  ASSERT_TRUE(txt.has_value());
  ASSERT_EQ(*txt, std::string("some total=1\n"));
  std::string why;
  ASSERT_TRUE(psistat::util::probe_readable("/proc/pressure/io", why));

  ASSERT_FALSE(psistat::util::read_file_string("/proc/pressure/nope").has_value());
  ASSERT_FALSE(psistat::util::probe_readable("/proc/pressure/nope", why));
  ASSERT_FALSE(why.empty());
  ASSERT_EQ(psistat::util::count_recent_kind_ms(psistat::util::ChurnKind::Read, 60000), 1);

  unsetenv("PSISTAT_PROC_ROOT");
  fs::remove_all(root);
}

TEST(churn_counts_by_kind_and_resets) {
  psistat::util::reset_churn();
  psistat::util::note_churn(psistat::util::ChurnKind::Parse);
  psistat::util::note_churn(psistat::util::ChurnKind::Parse);
  psistat::util::note_churn(psistat::util::ChurnKind::Read);
  ASSERT_EQ(psistat::util::count_recent_kind_ms(psistat::util::ChurnKind::Parse, 60000), 2);
  ASSERT_EQ(psistat::util::count_recent_kind_ms(psistat::util::ChurnKind::Read, 60000), 1);
  psistat::util::reset_churn();
  ASSERT_EQ(psistat::util::count_recent_kind_ms(psistat::util::ChurnKind::Parse, 60000), 0);
}
