#include "CrashgenSettingsCheck.h"

#include <string_view>
#include <variant>

namespace crashscan::scan_tool {
namespace {

using crashlog_core::CrashgenSettings;
using crashlog_core::FindCrashgenSetting;
using crashlog_core::HasModuleCaseInsensitive;
using crashlog_core::IsCrashgenSettingTruthy;

constexpr std::string_view kSeparator = "\n-----\n";

void AddSuccess(ReportBuffer* report, const std::string& message)
{
  report->Append("✔️ " + message + std::string(kSeparator));
}

void AddCaution(ReportBuffer* report, const std::string& warning, const std::string& fix)
{
  report->Extend({ "# ❌ CAUTION : " + warning + " # \n", " FIX: " + fix + std::string(kSeparator) });
}

bool HasModule(const CrashgenCheckContext& ctx, std::string_view name)
{
  return ctx.xse_modules && HasModuleCaseInsensitive(*ctx.xse_modules, name);
}

void CheckDisabledSettings(const CrashgenSettings& settings, const CrashgenCheckContext& ctx, ReportBuffer* report)
{
  for (const auto& [name, value] : settings) {
    const auto* b = std::get_if<bool>(&value);
    if (!b || *b || ctx.ignored_settings.count(name) != 0) {
      continue;
    }
    report->Append("* NOTICE : " + name + " is disabled in your " + ctx.crashgen_name +
                   " settings, is this intentional? * \n-----\n");
  }
}

void CheckAchievements(const CrashgenSettings& settings, const CrashgenCheckContext& ctx, ReportBuffer* report)
{
  const bool achievementsMod = HasModule(ctx, "achievements.dll") || HasModule(ctx, "unlimitedsurvivalmode.dll");
  if (IsCrashgenSettingTruthy(settings, "Achievements") && achievementsMod) {
    report->Extend({
      "# ❌ CAUTION : The Achievements Mod and/or Unlimited Survival Mode is installed, but Achievements is set to TRUE # \n",
      " FIX: Open " + ctx.crashgen_name + "'s TOML file and change Achievements to FALSE, this prevents conflicts with " +
        ctx.crashgen_name + ".\n-----\n",
    });
  } else {
    report->Append("✔️ Achievements parameter is correctly configured in your " + ctx.crashgen_name + " settings! \n-----\n");
  }
}

void CheckMemoryManagement(
  const CrashgenSettings& settings,
  const CrashgenCheckContext& ctx,
  const MemoryModPresence& mods,
  ReportBuffer* report)
{
  const std::string& cg = ctx.crashgen_name;
  if (IsCrashgenSettingTruthy(settings, "MemoryManager")) {
    if (mods.x_cell) {
      AddCaution(report, "X-Cell is installed, but MemoryManager parameter is set to TRUE",
                 "Open " + cg + "'s TOML file and change MemoryManager to FALSE, this prevents conflicts with X-Cell.");
    } else if (mods.baka_scrapheap) {
      AddCaution(report, "The Baka ScrapHeap Mod is installed, but is redundant with " + cg,
                 "Uninstall the Baka ScrapHeap Mod, this prevents conflicts with " + cg + ".");
    } else {
      AddSuccess(report, "Memory Manager parameter is correctly configured in your " + cg + " settings!");
    }
  } else if (mods.x_cell) {
    if (mods.baka_scrapheap) {
      AddCaution(report, "The Baka ScrapHeap Mod is installed, but is redundant with X-Cell",
                 "Uninstall the Baka ScrapHeap Mod, this prevents conflicts with X-Cell.");
    } else {
      AddSuccess(report, "Memory Manager parameter is correctly configured for use with X-Cell in your " + cg + " settings!");
    }
  } else if (mods.baka_scrapheap) {
    AddCaution(report, "The Baka ScrapHeap Mod is installed, but is redundant with " + cg,
               "Uninstall the Baka ScrapHeap Mod and open " + cg +
                 "'s TOML file and change MemoryManager to TRUE, this improves performance.");
  }

  if (!mods.x_cell) {
    return;
  }
  struct XCellSetting
  {
    const char* key;
    const char* display;
  };
  static constexpr XCellSetting kXCellSettings[] = {
    { "HavokMemorySystem", "Havok Memory System" },
    { "BSTextureStreamerLocalHeap", "BSTextureStreamerLocalHeap" },
    { "ScaleformAllocator", "Scaleform Allocator" },
    { "SmallBlockAllocator", "Small Block Allocator" },
  };
  for (const auto& s : kXCellSettings) {
    const std::string key = s.key;
    if (IsCrashgenSettingTruthy(settings, key)) {
      AddCaution(report, "X-Cell is installed, but " + key + " parameter is set to TRUE",
                 "Open " + cg + "'s TOML file and change " + key + " to FALSE, this prevents conflicts with X-Cell.");
    } else {
      AddSuccess(report, std::string(s.display) + " parameter is correctly configured for use with X-Cell in your " + cg + " settings!");
    }
  }
}

void CheckArchiveLimit(const CrashgenSettings& settings, const CrashgenCheckContext& ctx, ReportBuffer* report)
{
  if (CompareVersions(ctx.crashgen_latest, ctx.crashgen_version) > 0 ||
      CompareVersions(ctx.crashgen_version, "1.27.0") < 0) {
    return;
  }
  if (IsCrashgenSettingTruthy(settings, "ArchiveLimit")) {
    report->Extend({
      "# ❌ CAUTION : ArchiveLimit is set to TRUE, this setting is known to cause instability. # \n",
      " FIX: Open " + ctx.crashgen_name + "'s TOML file and change ArchiveLimit to FALSE.\n-----\n",
    });
  } else {
    report->Append("✔️ ArchiveLimit parameter is correctly configured in your " + ctx.crashgen_name + " settings! \n-----\n");
  }
}

void CheckLooksMenu(const CrashgenSettings& settings, const CrashgenCheckContext& ctx, ReportBuffer* report)
{
  if (!FindCrashgenSetting(settings, "F4EE")) {
    return;
  }
  if (!IsCrashgenSettingTruthy(settings, "F4EE") && HasModule(ctx, "f4ee.dll")) {
    report->Extend({
      "# ❌ CAUTION : Looks Menu is installed, but F4EE parameter under [Compatibility] is set to FALSE # \n",
      " FIX: Open " + ctx.crashgen_name +
        "'s TOML file and change F4EE to TRUE, this prevents bugs and crashes from Looks Menu.\n-----\n",
    });
  } else {
    report->Append("✔️ F4EE (Looks Menu) parameter is correctly configured in your " + ctx.crashgen_name + " settings! \n-----\n");
  }
}

}  // namespace

MemoryModPresence DetectMemoryMods(const std::set<std::string>& xseModules)
{
  MemoryModPresence out{};
  out.x_cell = HasModuleCaseInsensitive(xseModules, "x-cell-fo4.dll") ||
               HasModuleCaseInsensitive(xseModules, "x-cell-og.dll") ||
               HasModuleCaseInsensitive(xseModules, "x-cell-ng2.dll");
  out.baka_scrapheap = HasModuleCaseInsensitive(xseModules, "bakascrapheap.dll");
  return out;
}

void AddMemoryModIgnores(const MemoryModPresence& mods, std::set<std::string>* ignoredSettings)
{
  if (mods.x_cell) {
    ignoredSettings->insert({ "MemoryManager", "HavokMemorySystem", "ScaleformAllocator", "SmallBlockAllocator" });
  } else if (mods.baka_scrapheap) {
    ignoredSettings->insert("MemoryManager");
  }
}

void AppendCrashgenSettingsChecks(
  const crashlog_core::CrashgenSettings& settings,
  const CrashgenCheckContext& ctx,
  ReportBuffer* report)
{
  if (settings.empty()) {
    return;
  }
  const MemoryModPresence mods = ctx.xse_modules ? DetectMemoryMods(*ctx.xse_modules) : MemoryModPresence{};

  CheckDisabledSettings(settings, ctx, report);
  CheckAchievements(settings, ctx, report);
  CheckMemoryManagement(settings, ctx, mods, report);
  CheckArchiveLimit(settings, ctx, report);
  CheckLooksMenu(settings, ctx, report);
}

}  // namespace crashscan::scan_tool
