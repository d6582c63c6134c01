#include "LogCache.h"

#include <utility>

#include "CrashScanStringUtil.h"
#include "TextFileUtil.h"

namespace crashscan::scan_tool {

bool LogCache::AddFile(const std::filesystem::path& path, std::string* err)
{
  auto text = ReadWholeFile(path, err);
  if (!text) {
    return false;
  }
  AddText(path, std::move(*text));
  return true;
}

void LogCache::AddText(const std::filesystem::path& path, std::string text)
{
  std::lock_guard lock(m_mutex);
  m_entries[path.generic_string()] = std::move(text);
}

std::optional<std::vector<std::string>> LogCache::ReadLines(const std::filesystem::path& path) const
{
  std::lock_guard lock(m_mutex);
  const auto it = m_entries.find(path.generic_string());
  if (it == m_entries.end()) {
    return std::nullopt;
  }
  return SplitLines(it->second);
}

bool LogCache::Contains(const std::filesystem::path& path) const
{
  std::lock_guard lock(m_mutex);
  return m_entries.count(path.generic_string()) != 0;
}

std::size_t LogCache::Size() const
{
  std::lock_guard lock(m_mutex);
  return m_entries.size();
}

}  // namespace crashscan::scan_tool
