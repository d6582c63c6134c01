#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace crashscan::scan_tool {

// Read-only FormID descriptions keyed by (6-hex FormID suffix, plugin name).
// Source files hold "<plugin> | <formid> | <description>" lines.
// Sources are added before scanning starts; Lookup is safe to call concurrently.
class FormIdDatabase
{
public:
  bool AddSourceFile(const std::filesystem::path& path, std::string* err);
  bool AddSourceText(std::string_view name, std::string_view text);

  bool HasSources() const;
  std::size_t SourceCount() const;
  std::size_t CachedLookupCount() const;

  // First source with an entry wins. Misses are cached too.
  std::optional<std::string> Lookup(std::string_view formIdSuffix, std::string_view plugin) const;

private:
  struct Source
  {
    std::string name;
    std::unordered_map<std::string, std::string> entries;
  };
  std::vector<Source> m_sources;

  mutable std::mutex m_cacheMutex;
  mutable std::unordered_map<std::string, std::optional<std::string>> m_cache;
};

}  // namespace crashscan::scan_tool
