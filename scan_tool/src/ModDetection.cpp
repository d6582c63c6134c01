#include "ModDetection.h"

#include <algorithm>
#include <vector>

#include "CrashScanStringUtil.h"

namespace crashscan::scan_tool {
namespace {

std::vector<std::string> LowerPluginNames(const PluginList& plugins)
{
  std::vector<std::string> out;
  out.reserve(plugins.size());
  for (const auto& p : plugins) {
    out.push_back(AsciiLower(p.name));
  }
  return out;
}

bool AnyPluginContains(const std::vector<std::string>& pluginsLower, const std::string& fragmentLower)
{
  if (fragmentLower.empty()) {
    return false;
  }
  return std::any_of(pluginsLower.begin(), pluginsLower.end(),
    [&](const std::string& p) { return Contains(p, fragmentLower); });
}

// "a | b" -> ("a", "b"), both trimmed and lowercased.
bool SplitModPair(std::string_view key, std::string* first, std::string* second)
{
  std::string a;
  std::string b;
  if (!SplitOnce(key, "|", &a, &b)) {
    return false;
  }
  *first = AsciiLower(TrimAscii(a));
  *second = std::string(TrimAscii(b));
  return true;
}

}  // namespace

bool DetectModsSingle(const RuleTextList& mods, const PluginList& plugins, ReportBuffer* report)
{
  bool found = false;
  for (const auto& mod : mods) {
    const std::string keyLower = AsciiLower(mod.key);
    if (keyLower.empty()) {
      continue;
    }
    for (const auto& plugin : plugins) {
      if (!Contains(AsciiLower(plugin.name), keyLower)) {
        continue;
      }
      report->Append("[!] FOUND : [" + plugin.origin + "] " + mod.text);
      found = true;
      break;
    }
  }
  return found;
}

bool DetectModsDouble(const RuleTextList& mods, const PluginList& plugins, ReportBuffer* report)
{
  const auto pluginsLower = LowerPluginNames(plugins);
  bool found = false;
  for (const auto& mod : mods) {
    std::string first;
    std::string second;
    if (!SplitModPair(mod.key, &first, &second)) {
      continue;
    }
    if (AnyPluginContains(pluginsLower, first) && AnyPluginContains(pluginsLower, AsciiLower(second))) {
      report->Append("[!] CAUTION : " + mod.text);
      found = true;
    }
  }
  return found;
}

void DetectModsImportant(
  const RuleTextList& mods,
  const PluginList& plugins,
  const std::optional<std::string>& gpuRival,
  ReportBuffer* report)
{
  const auto pluginsLower = LowerPluginNames(plugins);
  for (const auto& mod : mods) {
    std::string id;
    std::string display;
    if (!SplitModPair(mod.key, &id, &display)) {
      continue;
    }
    const std::string textLower = AsciiLower(mod.text);
    const bool rivalMentioned = gpuRival && Contains(textLower, *gpuRival);

    if (AnyPluginContains(pluginsLower, id)) {
      if (rivalMentioned) {
        report->Extend({
          "❓ " + display + " is installed, BUT IT SEEMS YOU DON'T HAVE AN " + AsciiUpper(*gpuRival) + " GPU?\n",
          "IF THIS IS CORRECT, COMPLETELY UNINSTALL THIS MOD TO AVOID ANY PROBLEMS! \n\n",
        });
      } else {
        report->Append("✔️ " + display + " is installed!\n\n");
      }
    } else if (!mod.text.empty() && !rivalMentioned) {
      report->Extend({ "❌ " + display + " is not installed!\n", mod.text, "\n" });
    }
  }
}

}  // namespace crashscan::scan_tool
