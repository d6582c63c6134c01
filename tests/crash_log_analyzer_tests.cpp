#include <cassert>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "CrashLogAnalyzer.h"
#include "FormIdDatabase.h"
#include "ScanRules.h"

namespace {

using crashscan::scan_tool::AnalyzeCrashLog;
using crashscan::scan_tool::CrashLogScanResult;
using crashscan::scan_tool::FormIdDatabase;
using crashscan::scan_tool::IntegrityCheckResult;
using crashscan::scan_tool::OnceValue;
using crashscan::scan_tool::ParseScanRulesJson;
using crashscan::scan_tool::ScanContext;
using crashscan::scan_tool::ScanRules;
using crashscan::scan_tool::ScannerLabel;

const char* kRulesJson = R"JSON(
{
  "version": 1,
  "scanner": { "name": "CrashScan", "version": "v1.0.0", "version_date": "24.10.17" },
  "game": {
    "name": "Fallout4",
    "root_name": "Fallout 4",
    "xse_acronym": "F4SE",
    "crashgen_name": "Buffout 4",
    "crashgen_latest": "1.28.6",
    "crashgen_ignore": ["F4EE"],
    "game_version": "1.10.163",
    "game_version_new": "1.10.984",
    "required_files": ["Fallout4.exe"]
  },
  "warnings": { "outdated": "# OUTDATED CRASH GENERATOR #", "no_plugins": "# NO PLUGINS LOADED #\n" },
  "catch_log_records": ["name:"],
  "ignore_plugins": ["Fallout4.esm"],
  "suspects_error": { "5 | Memory Error": "EXCEPTION_ACCESS_VIOLATION" },
  "suspects_stack": { "3 | Stream Crash": ["BSResourceNiBinaryStream"] },
  "mods_freq": { "TacticalReload": "Tactical Reload \n    - Known to crash on reload.\n-----\n" },
  "mods_core": {
    "x-cell-fo4 | X-Cell": "Memory manager replacement.\n",
    "WeaponDebrisCrashFix | Weapon Debris Crash Fix": "Fix for Nvidia cards.\n"
  },
  "autoscan_text": "AUTOSCAN FOOTER TEXT\n"
}
)JSON";

std::vector<std::string> SampleLog()
{
  return {
    "Fallout 4 v1.10.163",
    "Buffout 4 v1.28.6",
    "",
    "Unhandled exception \"EXCEPTION_ACCESS_VIOLATION\" at 0x7FF6A1B2C3D4 Fallout4.exe+1234567",
    "",
    "\t[Compatibility]",
    "\t\tF4EE: true",
    "\t[Fixes]",
    "\t\tMemoryManager: true",
    "\t\tAchievements: true",
    "SYSTEM SPECS:",
    "\tOS: Microsoft Windows 10 Pro v10.0.19045",
    "\tCPU: AuthenticAMD AMD Ryzen 7 5800X",
    "\tGPU #1: Nvidia GA104 [GeForce RTX 3070]",
    "PROBABLE CALL STACK:",
    "\t[0] 0x7FF6A1B2C3D4 Fallout4.exe+1234567",
    "\t[1] 0x7FF6A1B2C3D5 BSResourceNiBinaryStream::Seek",
    "\t\tFile: \"TacticalReload.esm\"",
    "\t\tForm ID: 0x2A001234",
    "\t\tName: \"Reload Keyword\"",
    "MODULES:",
    "\tFallout4.exe 0x7FF6A0000000",
    "\tx-cell-fo4.dll 0x7FFB00000000",
    "F4SE PLUGINS:",
    "\tx-cell-fo4.dll v2",
    "\tBuffout4.dll v1.28.6",
    "PLUGINS:",
    "\t[00]     Fallout4.esm",
    "\t[2A]     TacticalReload.esm",
  };
}

bool Has(const std::string& text, const std::string& needle)
{
  return text.find(needle) != std::string::npos;
}

ScanRules LoadRules()
{
  ScanRules rules{};
  std::string err;
  const bool ok = ParseScanRulesJson(kRulesJson, &rules, &err);
  assert(ok);
  (void)ok;
  return rules;
}

void TestFullReport()
{
  const ScanRules rules = LoadRules();
  FormIdDatabase db;
  assert(db.AddSourceText("inline", "TacticalReload.esm | 001234 | Reload Keyword (TR_Keyword)\n"));

  ScanContext ctx{};
  ctx.rules = &rules;
  ctx.formids = &db;
  ctx.options.show_formid_values = true;

  const CrashLogScanResult result = AnalyzeCrashLog("logs/crash-2024-01-01-10-00-00.log", SampleLog(), ctx);
  const std::string& report = result.report;

  assert(!result.scan_failed);
  assert(result.stats.scanned == 1);
  assert(result.stats.incomplete == 0);
  assert(result.stats.failed == 0);

  assert(Has(report, "crash-2024-01-01-10-00-00.log -> AUTOSCAN REPORT GENERATED BY CrashScan v1.0.0 \n"));
  assert(Has(report, "Main Error: Unhandled exception \"EXCEPTION_ACCESS_VIOLATION\""));
  assert(Has(report, "* You have the latest version of Buffout 4! *"));
  assert(Has(report, "# Checking for Memory Error"));
  assert(Has(report, "SUSPECT FOUND! > Severity : 5 # \n"));
  assert(Has(report, "# Checking for Stream Crash"));
  assert(Has(report, "* NOTICE: FCX MODE IS DISABLED."));
  assert(Has(report, "# ❌ CAUTION : X-Cell is installed, but MemoryManager parameter is set to TRUE # \n"));
  assert(Has(report, "✔️ Achievements parameter is correctly configured"));
  assert(Has(report, "[!] FOUND : [2A] Tactical Reload \n"));
  assert(Has(report, "# FOUND NO MODS THAT ARE INCOMPATIBLE OR CONFLICT WITH YOUR OTHER MODS # \n"));
  assert(Has(report, "CHECKING FOR MODS PATCHED THROUGH OPC INSTALLER..."));
  assert(Has(report, "✔️ X-Cell is installed!\n\n"));
  assert(Has(report, "❌ Weapon Debris Crash Fix is not installed!\n"));
  assert(!Has(report, "PLUGIN LIMIT"));
  assert(Has(report, "- tacticalreload.esm | 1\n"));
  assert(!Has(report, "- fallout4.esm"));
  assert(Has(report, "- Form ID: 2A001234 | [TacticalReload.esm] | Reload Keyword (TR_Keyword) | 1\n"));
  assert(Has(report, "- Name: \"Reload Keyword\" | 1\n"));
  assert(Has(report, "AUTOSCAN FOOTER TEXT\n"));

  const std::string footer = ScannerLabel(rules) + " | 24.10.17 | END OF AUTOSCAN \n";
  assert(report.size() >= footer.size());
  assert(report.compare(report.size() - footer.size(), footer.size(), footer) == 0);

  // Descriptions stay hidden unless requested.
  ctx.options.show_formid_values = false;
  const auto plain = AnalyzeCrashLog("crash-2024-01-01-10-00-00.log", SampleLog(), ctx);
  assert(Has(plain.report, "- Form ID: 2A001234 | [TacticalReload.esm] | 1\n"));
}

void TestShortLogCountsAsFailed()
{
  const ScanRules rules = LoadRules();
  ScanContext ctx{};
  ctx.rules = &rules;

  auto lines = SampleLog();
  lines.resize(5);
  const auto result = AnalyzeCrashLog("crash-short.log", lines, ctx);
  assert(result.scan_failed);
  assert(result.stats.scanned == 0);
  assert(result.stats.failed == 1);
  assert(result.stats.incomplete == 1);
  assert(Has(result.report, "WAS NOT ABLE TO LOAD THE PLUGIN LIST FOR THIS CRASH LOG!"));
  assert(Has(result.report, "# NO PLUGINS LOADED #\n"));
}

void TestOutdatedCrashgenAndPluginLimit()
{
  const ScanRules rules = LoadRules();
  ScanContext ctx{};
  ctx.rules = &rules;

  auto lines = SampleLog();
  lines[1] = "Buffout 4 v1.26.2";
  lines.push_back("\t[FF]     Overflow.esp");
  const auto result = AnalyzeCrashLog("crash-limit.log", lines, ctx);
  assert(Has(result.report, "Detected Buffout 4 Version: Buffout 4 v1.26.2 \n# OUTDATED CRASH GENERATOR # \n"));
  assert(Has(result.report, "# 💀 CRITICAL : THE '[FF]' PLUGIN MEANS YOU REACHED THE PLUGIN LIMIT OF 255-ish PLUGINS # \n"));
}

void TestLoadOrderFileReplacesLogPlugins()
{
  const ScanRules rules = LoadRules();
  const auto loadOrder = std::filesystem::temp_directory_path() / "crashscan_analyzer_loadorder.txt";
  {
    std::ofstream f(loadOrder, std::ios::binary | std::ios::trunc);
    assert(f.is_open());
    f << "# This file was automatically generated.\nFallout4.esm\nOtherMod.esp\n";
  }

  ScanContext ctx{};
  ctx.rules = &rules;
  ctx.options.loadorder_path = loadOrder;
  const auto result = AnalyzeCrashLog("crash-2024-01-01-10-00-00.log", SampleLog(), ctx);
  assert(Has(result.report, "* ✔️ LOADORDER.TXT FILE FOUND IN THE MAIN CRASHSCAN FOLDER! *\n"));
  assert(!Has(result.report, "[!] FOUND : [2A]"));
  assert(!Has(result.report, "- tacticalreload.esm"));

  std::error_code ec;
  std::filesystem::remove(loadOrder, ec);
}

void TestFcxIntegrityCheckRunsOnce()
{
  const ScanRules rules = LoadRules();
  OnceValue<IntegrityCheckResult> integrity;
  int runs = 0;

  ScanContext ctx{};
  ctx.rules = &rules;
  ctx.options.fcx_mode = true;
  ctx.integrity = &integrity;
  ctx.run_integrity_check = [&runs]() {
    runs++;
    return IntegrityCheckResult{ "MAIN FILES OK\n", "GAME FILES OK\n" };
  };

  const auto first = AnalyzeCrashLog("crash-a.log", SampleLog(), ctx);
  const auto second = AnalyzeCrashLog("crash-b.log", SampleLog(), ctx);
  assert(runs == 1);
  assert(Has(first.report, "* NOTICE: FCX MODE IS ENABLED."));
  assert(Has(first.report, "MAIN FILES OK\nGAME FILES OK\n"));
  assert(Has(second.report, "MAIN FILES OK\nGAME FILES OK\n"));
}

void TestMissingRulesThrows()
{
  ScanContext ctx{};
  bool threw = false;
  try {
    AnalyzeCrashLog("crash-a.log", SampleLog(), ctx);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

}  // namespace

int main()
{
  TestFullReport();
  TestShortLogCountsAsFailed();
  TestOutdatedCrashgenAndPluginLimit();
  TestLoadOrderFileReplacesLogPlugins();
  TestFcxIntegrityCheckRunsOnce();
  TestMissingRulesThrows();
  return 0;
}
