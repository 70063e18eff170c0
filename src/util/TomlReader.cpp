#include "util/TomlReader.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <iterator>

namespace psistat::util {

static std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

// Cut a trailing '# comment' that is not inside a quoted string.
static std::string_view strip_comment(std::string_view sv) {
  char quote = 0;
  for (size_t i = 0; i < sv.size(); ++i) {
    char c = sv[i];
    if (quote) { if (c == quote) quote = 0; continue; }
    if (c == '"' || c == '\'') { quote = c; continue; }
    if (c == '#') return sv.substr(0, i);
  }
  return sv;
}

bool TomlReader::load(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) return false;
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return load_string(text);
}

bool TomlReader::load_string(std::string_view text) {
  entries_.clear();
  skipped_ = 0;
  std::string section;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    auto sv = trim(strip_comment(text.substr(start, end - start)));
    start = end + 1;
    if (sv.empty()) continue;
    if (sv.front() == '[') {
      if (sv.back() != ']' || sv.size() < 3 || sv[1] == '[') { ++skipped_; section.clear(); continue; }
      section = std::string(trim(sv.substr(1, sv.size() - 2)));
      continue;
    }
    auto eq = sv.find('=');
    if (eq == std::string_view::npos) { ++skipped_; continue; }
    auto key = trim(sv.substr(0, eq));
    auto val = trim(sv.substr(eq + 1));
    if (key.empty() || val.empty() || val.front() == '[' || val.front() == '{') { ++skipped_; continue; }
    if (val.front() == '"' || val.front() == '\'') {
      if (val.size() < 2 || val.back() != val.front()) { ++skipped_; continue; }
      val = val.substr(1, val.size() - 2);
    }
    set(section, std::string(key), std::string(val));
  }
  return true;
}

const TomlReader::Entry* TomlReader::find(std::string_view section, std::string_view key) const {
  for (const auto& e : entries_)
    if (e.section == section && e.key == key) return &e;
  return nullptr;
}

void TomlReader::set(const std::string& section, std::string key, std::string value) {
  for (auto& e : entries_) {
    if (e.section == section && e.key == key) { e.value = std::move(value); return; }
  }
  entries_.push_back(Entry{section, std::move(key), std::move(value)});
}

std::string TomlReader::get_string(std::string_view section, std::string_view key,
                                   const std::string& def) const {
  const auto* e = find(section, key);
  return e ? e->value : def;
}

int TomlReader::get_int(std::string_view section, std::string_view key, int def) const {
  const auto* e = find(section, key);
  if (!e || e->value.empty()) return def;
  int v = 0;
  const char* first = e->value.data();
  const char* last = first + e->value.size();
  if (*first == '+') ++first;
  auto [ptr, ec] = std::from_chars(first, last, v);
  if (ec != std::errc() || ptr != last) return def;
  return v;
}

bool TomlReader::get_bool(std::string_view section, std::string_view key, bool def) const {
  const auto* e = find(section, key);
  if (!e) return def;
  const auto& val = e->value;
  if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
  if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
  return def;
}

bool TomlReader::has(std::string_view section, std::string_view key) const {
  return find(section, key) != nullptr;
}

} // namespace psistat::util
