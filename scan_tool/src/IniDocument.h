#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crashscan::scan_tool {

// Line-preserving INI document. Section and key lookups are case-insensitive;
// keys that appear before any section header belong to the "" section.
// Set() rewrites only the affected line, so comments and layout survive a save.
class IniDocument
{
public:
  bool LoadFromFile(const std::filesystem::path& path, std::string* err);
  void LoadFromText(std::string_view text);

  bool HasSection(std::string_view section) const;
  bool Has(std::string_view section, std::string_view key) const;

  std::optional<std::string> Get(std::string_view section, std::string_view key) const;
  // 1/yes/true/on and 0/no/false/off; anything else is nullopt.
  std::optional<bool> GetBool(std::string_view section, std::string_view key) const;
  std::optional<std::int64_t> GetInt(std::string_view section, std::string_view key) const;
  std::optional<double> GetFloat(std::string_view section, std::string_view key) const;

  void Set(std::string_view section, std::string_view key, std::string_view value);

  // section (lowercase) -> key (lowercase) -> value, for content comparison.
  std::map<std::string, std::map<std::string, std::string>> Values() const;

  std::string ToText() const;
  bool SaveToFile(const std::filesystem::path& path, std::string* err) const;

private:
  struct Entry
  {
    std::string key_lower;
    std::string value;
    std::size_t line = 0;
    std::size_t value_offset = 0;
  };
  struct Section
  {
    std::string name;
    std::string name_lower;
    std::size_t header_line = 0;  // npos for the implicit "" section
    std::vector<Entry> entries;
  };

  void Reindex();
  const Section* FindSection(std::string_view section) const;
  const Entry* FindEntry(std::string_view section, std::string_view key) const;

  std::vector<std::string> m_lines;
  std::vector<Section> m_sections;
};

}  // namespace crashscan::scan_tool
