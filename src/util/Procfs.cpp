#include "util/Procfs.hpp"
#include "util/Churn.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace psistat::util {

static std::string proc_root() {
  const char* env = std::getenv("PSISTAT_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  auto root = proc_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_proc_path(abs));
  if (!in) {
    note_churn(ChurnKind::Read);
    return std::nullopt;
  }
  try {
    std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return s;
  } catch (const std::ios_base::failure&) {
    // File became unreadable between open and read
    note_churn(ChurnKind::Read);
    return std::nullopt;
  }
}

auto probe_readable(const std::string& abs, std::string& why) -> bool {
  auto path = map_proc_path(abs);
  std::FILE* f = std::fopen(path.c_str(), "r");
  if (!f) {
    why = std::strerror(errno);
    return false;
  }
  // /proc/pressure files open fine on kernels with psi=0 but fail on read
  char buf[1];
  std::size_t n = std::fread(buf, 1, sizeof(buf), f);
  bool ok = n > 0 || std::ferror(f) == 0;
  if (!ok) why = std::strerror(errno ? errno : EIO);
  std::fclose(f);
  return ok;
}

} // namespace psistat::util
