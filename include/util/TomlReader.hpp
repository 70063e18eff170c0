#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace psistat::util {

// Flat [section] key = value reader for the config file. Handles comments
// (full-line and trailing), "double" and 'single' quoted strings, integers
// and booleans. Arrays, tables-of-tables and multi-line strings are not
// supported and such lines are skipped.
class TomlReader {
public:
  bool load(const std::string& path);
  bool load_string(std::string_view text);

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const;
  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const;
  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const;
  [[nodiscard]] bool has(std::string_view section, std::string_view key) const;

  // Lines that looked like assignments but could not be read.
  [[nodiscard]] int skipped_lines() const { return skipped_; }

private:
  struct Entry { std::string section, key, value; };
  std::vector<Entry> entries_;
  int skipped_{0};

  [[nodiscard]] const Entry* find(std::string_view section, std::string_view key) const;
  void set(const std::string& section, std::string key, std::string value);
};

} // namespace psistat::util
