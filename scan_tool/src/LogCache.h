#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace crashscan::scan_tool {

// Raw crash log bytes keyed by log path. Filled before workers start, read-only afterwards.
class LogCache
{
public:
  bool AddFile(const std::filesystem::path& path, std::string* err);
  void AddText(const std::filesystem::path& path, std::string text);

  std::optional<std::vector<std::string>> ReadLines(const std::filesystem::path& path) const;
  bool Contains(const std::filesystem::path& path) const;
  std::size_t Size() const;

private:
  mutable std::mutex m_mutex;
  std::unordered_map<std::string, std::string> m_entries;
};

}  // namespace crashscan::scan_tool
