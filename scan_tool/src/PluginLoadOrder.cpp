#include "PluginLoadOrder.h"

#include <algorithm>
#include <regex>

#include <spdlog/spdlog.h>

#include "CrashLogParseCore.h"
#include "CrashScanStringUtil.h"
#include "TextFileUtil.h"

namespace crashscan::scan_tool {
namespace {

constexpr std::string_view kPluginLimitMarker = "[FF]";
constexpr std::string_view kLimitCheckFixedCrashgen = "1.37.0";

const std::regex& PluginLineRegex()
{
  // [XX] Name.esp | [FE:XXX] Name.esl | Name.esm / Name.dll without a slot
  static const std::regex re(
    R"(^\s*(?:\[(FE:[0-9A-F]{3}|[0-9A-F]{2})\]\s*)?(.+?(?:\.es[pml])+|\S+\.dll))",
    std::regex::ECMAScript | std::regex::icase);
  return re;
}

bool VersionMatches(std::string_view version, std::string_view ruleVersion)
{
  return !ruleVersion.empty() && CompareVersions(version, ruleVersion) == 0;
}

}  // namespace

const PluginEntry* FindPlugin(const PluginList& plugins, std::string_view name)
{
  for (const auto& p : plugins) {
    if (p.name == name) {
      return &p;
    }
  }
  return nullptr;
}

bool AddPluginIfAbsent(PluginList* plugins, std::string_view name, std::string_view origin)
{
  if (!plugins || name.empty() || FindPlugin(*plugins, name)) {
    return false;
  }
  plugins->push_back(PluginEntry{ std::string(name), std::string(origin) });
  return true;
}

PluginList ParseLoadOrderText(std::string_view text)
{
  PluginList out;
  const auto lines = SplitLines(text);
  for (std::size_t i = 1; i < lines.size(); i++) {
    AddPluginIfAbsent(&out, TrimAscii(lines[i]), kPluginOriginLoadOrder);
  }
  return out;
}

LoadOrderFileResult ReadLoadOrderFile(const std::filesystem::path& path)
{
  LoadOrderFileResult out{};
  out.report_lines = {
    "* ✔️ LOADORDER.TXT FILE FOUND IN THE MAIN CRASHSCAN FOLDER! *\n",
    "CrashScan will now ignore plugins in all crash logs and only detect plugins in this file.\n",
    "[ To disable this functionality, simply remove loadorder.txt from your CrashScan folder. ]\n\n",
  };

  std::string err;
  const auto text = ReadWholeFile(path, &err);
  if (!text) {
    spdlog::warn("CrashScan: load order file unreadable: {}", err);
    out.report_lines.push_back("Error reading loadorder.txt: " + err + "\n");
  } else {
    out.plugins = ParseLoadOrderText(*text);
  }
  out.plugins_loaded = !out.plugins.empty();
  return out;
}

LoadOrderScanResult ScanPluginSegment(const std::vector<std::string>& pluginSegment, const LoadOrderVersionContext& ctx)
{
  LoadOrderScanResult out{};
  if (pluginSegment.empty()) {
    return out;
  }

  const bool isOriginalGame =
    VersionMatches(ctx.game_version, ctx.game_version_original) || VersionMatches(ctx.game_version, ctx.game_version_vr);
  const bool isNewGameOldCrashgen =
    !ctx.game_version_new.empty() &&
    CompareVersions(ctx.game_version, ctx.game_version_new) >= 0 &&
    IsVersionLessThan(ctx.crashgen_version, kLimitCheckFixedCrashgen);

  for (const auto& entry : pluginSegment) {
    if (Contains(entry, kPluginLimitMarker)) {
      if (isOriginalGame) {
        out.plugin_limit_triggered = true;
      } else if (isNewGameOldCrashgen) {
        out.limit_check_disabled = true;
      }
    }

    std::smatch m;
    if (!std::regex_search(entry, m, PluginLineRegex())) {
      continue;
    }
    const std::string name(TrimAscii(m[2].str()));
    if (name.empty() || FindPlugin(out.plugins, name)) {
      continue;
    }

    if (m[1].matched) {
      std::string id = m[1].str();
      id.erase(std::remove(id.begin(), id.end(), ':'), id.end());
      out.plugins.push_back(PluginEntry{ name, id });
    } else if (ContainsCaseInsensitiveAscii(name, "dll")) {
      out.plugins.push_back(PluginEntry{ name, std::string(kPluginOriginDll) });
    } else {
      out.plugins.push_back(PluginEntry{ name, std::string(kPluginOriginUnknown) });
    }
  }
  return out;
}

void AddModulePlugins(PluginList* plugins, const std::set<std::string>& xseModules, const std::vector<std::string>& allModulesSegment)
{
  if (!plugins) {
    return;
  }

  std::vector<std::string> pending;
  for (const auto& module : xseModules) {
    const bool covered = std::any_of(plugins->begin(), plugins->end(), [&](const PluginEntry& p) {
      return Contains(p.name, module);
    });
    if (!covered) {
      pending.push_back(module);
    }
  }
  for (const auto& module : pending) {
    AddPluginIfAbsent(plugins, module, kPluginOriginDll);
  }

  for (const auto& line : allModulesSegment) {
    if (!ContainsCaseInsensitiveAscii(line, "vulkan")) {
      continue;
    }
    const std::string_view trimmed = TrimAscii(line);
    const auto space = trimmed.find(' ');
    const std::string_view first = trimmed.substr(0, space);
    if (auto it = std::find_if(plugins->begin(), plugins->end(), [&](const PluginEntry& p) { return p.name == first; });
        it != plugins->end()) {
      it->origin = std::string(kPluginOriginDll);
    } else {
      AddPluginIfAbsent(plugins, first, kPluginOriginDll);
    }
  }
}

void RemoveIgnoredPlugins(PluginList* plugins, const std::vector<std::string>& ignoreList)
{
  if (!plugins || ignoreList.empty()) {
    return;
  }
  plugins->erase(
    std::remove_if(plugins->begin(), plugins->end(), [&](const PluginEntry& p) {
      return std::any_of(ignoreList.begin(), ignoreList.end(), [&](const std::string& ignored) {
        return EqualsCaseInsensitiveAscii(p.name, ignored);
      });
    }),
    plugins->end());
}

}  // namespace crashscan::scan_tool
