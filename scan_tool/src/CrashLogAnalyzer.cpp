#include "CrashLogAnalyzer.h"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "CrashLogParseCore.h"
#include "CrashScanStringUtil.h"
#include "CrashgenSettingsCheck.h"
#include "FormIdDatabase.h"
#include "ModDetection.h"
#include "PluginLoadOrder.h"
#include "ReportBuffer.h"
#include "StackCorrelator.h"

namespace crashscan::scan_tool {
namespace {

using crashlog_core::CrashLogSegment;

constexpr std::string_view kBannerRule = "====================================================\n";

void AppendBanner(ReportBuffer* report, std::string_view title)
{
  report->Extend({ kBannerRule, title, "\n", kBannerRule });
}

const std::vector<std::string>& Segment(const std::vector<std::vector<std::string>>& segments, CrashLogSegment which)
{
  return segments[static_cast<std::size_t>(which)];
}

bool IsFallout4(const ScanRules& rules)
{
  std::string name = rules.game_name;
  name.erase(std::remove(name.begin(), name.end(), ' '), name.end());
  return name == "Fallout4";
}

// An empty threshold never counts as reached.
bool VersionReached(const std::string& current, const std::string& threshold)
{
  return !threshold.empty() && CompareVersions(current, threshold) >= 0;
}

std::vector<std::string> LowerAll(const std::vector<std::string>& items)
{
  std::vector<std::string> out;
  out.reserve(items.size());
  for (const auto& s : items) {
    out.push_back(AsciiLower(s));
  }
  return out;
}

std::string JoinLines(const std::vector<std::string>& lines)
{
  std::string out;
  for (const auto& l : lines) {
    out += l;
  }
  return out;
}

void AppendHeader(ReportBuffer* report, const std::filesystem::path& logPath, const ScanRules& rules)
{
  report->Extend({
    logPath.filename().string() + " -> AUTOSCAN REPORT GENERATED BY " + ScannerLabel(rules) + " \n",
    "# FOR BEST VIEWING EXPERIENCE OPEN THIS FILE IN NOTEPAD++ OR SIMILAR # \n",
    "# PLEASE READ EVERYTHING CAREFULLY AND BEWARE OF FALSE POSITIVES # \n",
    kBannerRule,
  });
}

void AppendVersionNotice(ReportBuffer* report, const crashlog_core::CrashLogMetadata& meta, const ScanRules& rules)
{
  const std::string current = ExtractVersionToken(meta.crashgen_version);
  report->Append("\nMain Error: " + meta.main_error + "\n");
  report->Append("Detected " + rules.crashgen_name + " Version: " + meta.crashgen_version + " \n");
  if (VersionReached(current, rules.crashgen_latest) || VersionReached(current, rules.crashgen_latest_vr)) {
    report->Append("* You have the latest version of " + rules.crashgen_name + "! *\n\n");
  } else {
    report->Append(rules.warn_outdated + " \n");
  }
}

bool AppendSuspects(ReportBuffer* report, const std::string& mainError, const std::vector<std::string>& callStack, const ScanRules& rules)
{
  AppendBanner(report, "CHECKING IF LOG MATCHES ANY KNOWN CRASH SUSPECTS...");

  const std::string errorLower = AsciiLower(mainError);
  if (Contains(errorLower, ".dll") && !Contains(errorLower, "tbbmalloc")) {
    report->Extend({
      "* NOTICE : MAIN ERROR REPORTS THAT A DLL FILE WAS INVOLVED IN THIS CRASH! * \n",
      "If that dll file belongs to a mod, that mod is a prime suspect for the crash. \n-----\n",
    });
  }

  const SuspectEvaluation eval = rules.suspects.Evaluate(mainError, JoinLines(callStack));
  for (const auto& m : eval.main_error_matches) {
    report->Append(FormatSuspectLine(m, kSuspectNameWidth));
  }
  for (const auto& m : eval.stack_matches) {
    report->Append(FormatSuspectLine(m, kSuspectNameWidth));
  }

  if (eval.AnyFound()) {
    report->Extend({
      "* FOR DETAILED DESCRIPTIONS AND POSSIBLE SOLUTIONS TO ANY ABOVE DETECTED CRASH SUSPECTS *\n",
      "* SEE: https://docs.google.com/document/d/17FzeIMJ256xE85XdjoPvv_Zi3C5uHeSTQh6wOZugs4c *\n\n",
    });
  } else {
    report->Extend({
      "# FOUND NO CRASH ERRORS / SUSPECTS THAT MATCH THE CURRENT DATABASE #\n",
      "Check below for mods that can cause frequent crashes and other problems.\n\n",
    });
  }
  return eval.AnyFound();
}

void AppendSettingsSection(
  ReportBuffer* report,
  const std::vector<std::string>& crashgenSegment,
  const std::set<std::string>& xseModules,
  const std::string& crashgenVersion,
  const ScanContext& ctx)
{
  const ScanRules& rules = *ctx.rules;
  AppendBanner(report, "CHECKING IF NECESSARY FILES/SETTINGS ARE CORRECT...");

  if (ctx.options.fcx_mode) {
    report->Extend({
      "* NOTICE: FCX MODE IS ENABLED. CRASHSCAN MUST BE RUN BY THE ORIGINAL USER FOR CORRECT DETECTION * \n",
      "[ To disable mod & game files detection, set FcxMode = false in CrashScan.ini or drop --fcx ] \n\n",
    });
    if (ctx.integrity && ctx.run_integrity_check) {
      const IntegrityCheckResult& integrity = ctx.integrity->GetOrCompute(ctx.run_integrity_check);
      report->Append(integrity.main_files);
      report->Append(integrity.game_files);
    }
  } else {
    report->Extend({
      "* NOTICE: FCX MODE IS DISABLED. YOU CAN ENABLE IT TO DETECT PROBLEMS IN YOUR MOD & GAME FILES * \n",
      "[ FCX Mode can be enabled with --fcx or FcxMode = true in CrashScan.ini. ] \n\n",
    });
  }

  CrashgenCheckContext check{};
  check.crashgen_name = rules.crashgen_name;
  check.crashgen_version = crashgenVersion;
  check.crashgen_latest = rules.crashgen_latest;
  check.ignored_settings.insert(rules.crashgen_ignore.begin(), rules.crashgen_ignore.end());
  check.xse_modules = &xseModules;
  AddMemoryModIgnores(DetectMemoryMods(xseModules), &check.ignored_settings);

  AppendCrashgenSettingsChecks(crashlog_core::ParseCrashgenSettings(crashgenSegment), check, report);
}

void AppendModSections(
  ReportBuffer* report,
  const PluginList& plugins,
  bool pluginsLoaded,
  const crashlog_core::GpuInfo& gpu,
  const ScanRules& rules)
{
  AppendBanner(report, "CHECKING FOR MODS THAT CAN CAUSE FREQUENT CRASHES...");
  if (pluginsLoaded) {
    DetectModsSingle(rules.mods_freq, plugins, report);
  } else {
    report->Append(
      "* [!] NOTICE : " + AsciiUpper(rules.crashgen_name) + " WAS NOT ABLE TO LOAD THE PLUGIN LIST FOR THIS CRASH LOG! *\n"
      "  CrashScan cannot perform the full scan. Provide or scan a different crash log\n"
      "  OR pass your *loadorder.txt* with --loadorder.\n");
  }

  AppendBanner(report, "CHECKING FOR MODS THAT CONFLICT WITH OTHER MODS...");
  if (!pluginsLoaded) {
    report->Append(rules.warn_no_plugins);
  } else if (DetectModsDouble(rules.mods_conf, plugins, report)) {
    report->Extend({
      "# [!] CAUTION : FOUND MODS THAT ARE INCOMPATIBLE OR CONFLICT WITH YOUR OTHER MODS # \n",
      "* YOU SHOULD CHOOSE WHICH MOD TO KEEP AND DISABLE OR COMPLETELY REMOVE THE OTHER MOD * \n\n",
    });
  } else {
    report->Append("# FOUND NO MODS THAT ARE INCOMPATIBLE OR CONFLICT WITH YOUR OTHER MODS # \n\n");
  }

  AppendBanner(report, "CHECKING FOR MODS WITH SOLUTIONS & COMMUNITY PATCHES");
  if (!pluginsLoaded) {
    report->Append(rules.warn_no_plugins);
  } else if (DetectModsSingle(rules.mods_solu, plugins, report)) {
    report->Extend({
      "# [!] CAUTION : FOUND PROBLEMATIC MODS WITH SOLUTIONS AND COMMUNITY PATCHES # \n",
      "[Due to limitations, CrashScan will show warnings for some mods even if fixes or patches are already installed.] \n",
      "[To hide these warnings, add their plugin names to ignore_list in the rule data. ONE PLUGIN PER ENTRY.] \n\n",
    });
  } else {
    report->Append("# FOUND NO PROBLEMATIC MODS WITH AVAILABLE SOLUTIONS AND COMMUNITY PATCHES # \n\n");
  }

  if (IsFallout4(rules)) {
    AppendBanner(report, "CHECKING FOR MODS PATCHED THROUGH OPC INSTALLER...");
    if (!pluginsLoaded) {
      report->Append(rules.warn_no_plugins);
    } else if (DetectModsSingle(rules.mods_opc2, plugins, report)) {
      report->Extend({
        "\n* FOR PATCH REPOSITORY THAT PREVENTS CRASHES AND FIXES PROBLEMS IN THESE AND OTHER MODS,* \n",
        "* VISIT OPTIMIZATION PATCHES COLLECTION: https://www.nexusmods.com/fallout4/mods/54872 * \n\n",
      });
    } else {
      report->Append("# FOUND NO PROBLEMATIC MODS THAT ARE ALREADY PATCHED THROUGH THE OPC INSTALLER # \n\n");
    }
  }

  AppendBanner(report, "CHECKING IF IMPORTANT PATCHES & FIXES ARE INSTALLED");
  if (!pluginsLoaded) {
    report->Append(rules.warn_no_plugins);
    return;
  }
  const bool londonLoaded = std::any_of(plugins.begin(), plugins.end(),
    [](const PluginEntry& p) { return ContainsCaseInsensitiveAscii(p.name, "londonworldspace"); });
  DetectModsImportant(londonLoaded ? rules.mods_core_folon : rules.mods_core, plugins, gpu.rival, report);
}

void AppendPluginLimit(ReportBuffer* report, const LoadOrderScanResult& scan, bool pluginsLoaded, const ScanRules& rules)
{
  if (!pluginsLoaded || (!scan.plugin_limit_triggered && !scan.limit_check_disabled)) {
    return;
  }
  if (!scan.limit_check_disabled) {
    report->Append("# 💀 CRITICAL : THE '[FF]' PLUGIN MEANS YOU REACHED THE PLUGIN LIMIT OF 255-ish PLUGINS # \n");
  } else {
    report->Extend({
      "# ⚠️ WARNING : THE '[FF]' PLUGIN WAS DETECTED BUT PLUGIN LIMIT CHECK IS DISABLED. # \n",
      "This could indicate that your version of " + rules.crashgen_name + " NG is out of date. \n",
      "Recommendation: Consider updating " + rules.crashgen_name + " NG to the latest version. \n-----\n",
    });
  }
}

void AppendStackSuspects(
  ReportBuffer* report,
  const std::vector<std::string>& callStack,
  const PluginList& plugins,
  const ScanContext& ctx)
{
  const ScanRules& rules = *ctx.rules;
  AppendBanner(report, "SCANNING THE LOG FOR SPECIFIC (POSSIBLE) SUSPECTS...");

  report->Append("# LIST OF (POSSIBLE) PLUGIN SUSPECTS #\n");
  AppendPluginSuspects(report, MatchPluginsInStack(callStack, plugins, LowerAll(rules.ignore_plugins)), rules.crashgen_name);

  report->Append("\n# LIST OF (POSSIBLE) FORM ID SUSPECTS #\n");
  const auto formIds = CollectFormIds(callStack);
  const FormIdDatabase* db = ctx.options.show_formid_values ? ctx.formids : nullptr;
  AppendFormIdSuspects(report, !formIds.empty(), CorrelateFormIds(formIds, plugins, db), rules.crashgen_name);

  report->Append("\n# LIST OF DETECTED (NAMED) RECORDS #\n");
  NamedRecordRules recordRules{};
  recordRules.records_lower = LowerAll(rules.catch_log_records);
  recordRules.ignore_lower = LowerAll(rules.ignore_records);
  AppendNamedRecords(report, ScanNamedRecords(callStack, recordRules), rules.crashgen_name);
}

}  // namespace

std::string ScannerLabel(const ScanRules& rules)
{
  if (rules.scanner_version.empty()) {
    return rules.scanner_name;
  }
  return rules.scanner_name + " " + rules.scanner_version;
}

CrashLogScanResult AnalyzeCrashLog(
  const std::filesystem::path& logPath,
  const std::vector<std::string>& lines,
  const ScanContext& ctx)
{
  if (!ctx.rules) {
    throw std::invalid_argument("AnalyzeCrashLog requires rule data");
  }
  const ScanRules& rules = *ctx.rules;

  CrashLogScanResult result{};
  result.log_path = logPath;
  result.stats.scanned = 1;

  ReportBuffer report;
  AppendHeader(&report, logPath, rules);

  const auto segments = ExtractSegments(lines, crashlog_core::DefaultSegmentBoundaries(rules.xse_acronym));
  const auto meta = ExtractCrashLogMetadata(lines, rules.game_root_name, rules.crashgen_name);
  const auto& pluginSegment = Segment(segments, CrashLogSegment::kPlugins);
  const auto& callStack = Segment(segments, CrashLogSegment::kCallStack);

  if (lines.size() < kMinCrashLogLines) {
    result.stats.scanned -= 1;
    result.stats.failed += 1;
    result.scan_failed = true;
  }

  AppendVersionNotice(&report, meta, rules);

  const std::string gameEsm = rules.game_name + ".esm";
  bool pluginsLoaded = !rules.game_name.empty() &&
    std::any_of(pluginSegment.begin(), pluginSegment.end(), [&](const std::string& l) { return Contains(l, gameEsm); });
  if (!pluginsLoaded) {
    result.stats.incomplete += 1;
  }

  const std::string crashgenVersion = ExtractVersionToken(meta.crashgen_version);
  LoadOrderScanResult loadOrder{};
  std::error_code ec;
  if (!ctx.options.loadorder_path.empty() && std::filesystem::exists(ctx.options.loadorder_path, ec)) {
    auto fromFile = ReadLoadOrderFile(ctx.options.loadorder_path);
    report.Extend(fromFile.report_lines);
    loadOrder.plugins = std::move(fromFile.plugins);
    pluginsLoaded = fromFile.plugins_loaded;
  } else {
    LoadOrderVersionContext versions{};
    versions.game_version = ExtractVersionToken(meta.game_version);
    versions.crashgen_version = crashgenVersion;
    versions.game_version_original = rules.game_version;
    versions.game_version_vr = rules.game_version_vr;
    versions.game_version_new = rules.game_version_new;
    loadOrder = ScanPluginSegment(pluginSegment, versions);
  }

  const auto xseModules = crashlog_core::ExtractModuleNames(Segment(segments, CrashLogSegment::kXseModules));
  PluginList& plugins = loadOrder.plugins;
  AddModulePlugins(&plugins, xseModules, Segment(segments, CrashLogSegment::kAllModules));
  RemoveIgnoredPlugins(&plugins, rules.ignore_list);

  const auto gpu = crashlog_core::DetectGpu(Segment(segments, CrashLogSegment::kSystem));

  AppendSuspects(&report, meta.main_error, callStack, rules);
  AppendSettingsSection(&report, Segment(segments, CrashLogSegment::kCrashgen), xseModules, crashgenVersion, ctx);
  AppendModSections(&report, plugins, pluginsLoaded, gpu, rules);
  AppendPluginLimit(&report, loadOrder, pluginsLoaded, rules);
  AppendStackSuspects(&report, callStack, plugins, ctx);

  if (IsFallout4(rules)) {
    report.Append(rules.autoscan_text);
  }
  report.Append(ScannerLabel(rules) + " | " + rules.scanner_version_date + " | END OF AUTOSCAN \n");

  spdlog::debug("CrashScan: analyzed {} ({} plugins, gpu {})", logPath.filename().string(), plugins.size(), gpu.manufacturer);
  result.report = report.Join();
  return result;
}

}  // namespace crashscan::scan_tool
