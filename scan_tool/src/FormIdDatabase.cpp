#include "FormIdDatabase.h"

#include <cctype>

#include <spdlog/spdlog.h>

#include "CrashScanStringUtil.h"
#include "TextFileUtil.h"

namespace crashscan::scan_tool {
namespace {

std::string NormalizeFormIdSuffix(std::string_view formId)
{
  std::string id(TrimAscii(formId));
  if (id.size() > 2 && id[0] == '0' && (id[1] == 'x' || id[1] == 'X')) {
    id.erase(0, 2);
  }
  for (auto& c : id) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  if (id.size() == 8) {
    id.erase(0, 2);
  }
  return id;
}

std::string MakeKey(std::string_view formIdSuffix, std::string_view plugin)
{
  return NormalizeFormIdSuffix(formIdSuffix) + "|" + AsciiLower(TrimAscii(plugin));
}

}  // namespace

bool FormIdDatabase::AddSourceFile(const std::filesystem::path& path, std::string* err)
{
  const auto text = ReadWholeFile(path, err);
  if (!text) {
    return false;
  }
  if (!AddSourceText(path.string(), *text)) {
    if (err) *err = "no FormID entries in " + path.string();
    return false;
  }
  return true;
}

bool FormIdDatabase::AddSourceText(std::string_view name, std::string_view text)
{
  Source src{};
  src.name = std::string(name);
  for (const auto& raw : SplitLines(text)) {
    const std::string_view line = TrimAscii(raw);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    std::string plugin;
    std::string rest;
    if (!SplitOnce(line, " | ", &plugin, &rest)) {
      continue;
    }
    std::string formId;
    std::string entry;
    if (!SplitOnce(rest, " | ", &formId, &entry)) {
      continue;
    }
    if (plugin.empty() || formId.empty()) {
      continue;
    }
    src.entries.emplace(MakeKey(formId, plugin), std::string(TrimAscii(entry)));
  }

  if (src.entries.empty()) {
    return false;
  }
  spdlog::info("CrashScan: FormID source {} ({} entries)", src.name, src.entries.size());
  m_sources.push_back(std::move(src));

  // Cached misses may now resolve against the new source.
  std::lock_guard lock(m_cacheMutex);
  m_cache.clear();
  return true;
}

bool FormIdDatabase::HasSources() const
{
  return !m_sources.empty();
}

std::size_t FormIdDatabase::SourceCount() const
{
  return m_sources.size();
}

std::size_t FormIdDatabase::CachedLookupCount() const
{
  std::lock_guard lock(m_cacheMutex);
  return m_cache.size();
}

std::optional<std::string> FormIdDatabase::Lookup(std::string_view formIdSuffix, std::string_view plugin) const
{
  const std::string key = MakeKey(formIdSuffix, plugin);
  {
    std::lock_guard lock(m_cacheMutex);
    if (auto it = m_cache.find(key); it != m_cache.end()) {
      return it->second;
    }
  }

  std::optional<std::string> found;
  for (const auto& src : m_sources) {
    if (auto it = src.entries.find(key); it != src.entries.end()) {
      found = it->second;
      break;
    }
  }

  std::lock_guard lock(m_cacheMutex);
  m_cache.emplace(key, found);
  return found;
}

}  // namespace crashscan::scan_tool
