#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace crashscan::scan_tool {

inline constexpr std::string_view kPluginOriginDll = "DLL";
inline constexpr std::string_view kPluginOriginUnknown = "???";
inline constexpr std::string_view kPluginOriginLoadOrder = "LO";

struct PluginEntry
{
  std::string name;    // display case
  std::string origin;  // "2A", "FE001", "DLL", "???" or "LO"
};

// Insertion-ordered; at most one entry per name (first occurrence wins).
using PluginList = std::vector<PluginEntry>;

const PluginEntry* FindPlugin(const PluginList& plugins, std::string_view name);
bool AddPluginIfAbsent(PluginList* plugins, std::string_view name, std::string_view origin);

struct LoadOrderFileResult
{
  PluginList plugins;
  bool plugins_loaded = false;
  std::vector<std::string> report_lines;
};

// Header line is skipped; remaining non-blank lines become "LO" entries.
PluginList ParseLoadOrderText(std::string_view text);

// Read errors become a report line; they never throw.
LoadOrderFileResult ReadLoadOrderFile(const std::filesystem::path& path);

struct LoadOrderVersionContext
{
  std::string game_version;      // from the log header
  std::string crashgen_version;  // from the log header
  std::string game_version_original;
  std::string game_version_vr;
  std::string game_version_new;
};

struct LoadOrderScanResult
{
  PluginList plugins;
  bool plugin_limit_triggered = false;
  bool limit_check_disabled = false;
};

LoadOrderScanResult ScanPluginSegment(const std::vector<std::string>& pluginSegment, const LoadOrderVersionContext& ctx);

// XSE modules not already part of a plugin name and vulkan modules are added as "DLL".
void AddModulePlugins(PluginList* plugins, const std::set<std::string>& xseModules, const std::vector<std::string>& allModulesSegment);

// Case-insensitive removal of user-ignored plugins.
void RemoveIgnoredPlugins(PluginList* plugins, const std::vector<std::string>& ignoreList);

}  // namespace crashscan::scan_tool
