#include "ConfigAuditor.h"
#include "FormIdDatabase.h"
#include "ScanRules.h"
#include "ScanSession.h"
#include "ScanToolCliArgs.h"
#include "ScanToolConfig.h"
#include "ScanToolLog.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

std::string ReadEnvString(const char* key)
{
  if (!key || !*key) {
    return {};
  }
  const char* value = std::getenv(key);
  return value ? std::string(value) : std::string{};
}

void ApplyCliOverrides(const crashscan::scan_tool::cli::ScanToolCliArgs& a, crashscan::scan_tool::ScanToolConfig* cfg)
{
  if (a.rules_path) {
    cfg->rulesPath = *a.rules_path;
  }
  if (a.logs_dir) {
    cfg->crashLogDir = *a.logs_dir;
  }
  if (a.game_root) {
    cfg->gameRootPath = *a.game_root;
  }
  if (a.loadorder_path) {
    cfg->loadOrderPath = *a.loadorder_path;
  }
  if (!a.formid_sources.empty()) {
    cfg->formIdSources.assign(a.formid_sources.begin(), a.formid_sources.end());
  }
  if (a.workers) {
    cfg->maxWorkers = *a.workers;
  }
  if (a.fcx_mode) {
    cfg->fcxMode = *a.fcx_mode;
  }
  if (a.show_formid_values) {
    cfg->showFormIdValues = *a.show_formid_values;
  }
  if (a.simplify_logs) {
    cfg->simplifyLogs = *a.simplify_logs;
  }
}

int RunAuditOnly(const crashscan::scan_tool::ScanToolConfig& cfg, const crashscan::scan_tool::ScanRules& rules)
{
  using namespace crashscan::scan_tool;

  std::cout << CheckRequiredGameFiles(cfg.gameRootPath, rules.required_files);

  ConfigAuditOptions opt{};
  opt.game_root = cfg.gameRootPath;
  opt.game_name = rules.game_name;
  std::string report;
  std::string err;
  if (!AuditGameConfigFiles(opt, &report, &err)) {
    std::cerr << "[CrashScanCli] config audit failed: " << err << "\n";
    return 3;
  }
  std::cout << report;
  return 0;
}

}  // namespace

int main(int argc, char** argv)
{
  using namespace crashscan::scan_tool;

  std::vector<std::string_view> args;
  if (argc > 0 && argv) {
    args.reserve(static_cast<std::size_t>(argc));
    for (int i = 0; i < argc; i++) {
      const char* s = argv[i];
      args.emplace_back(s ? std::string_view(s) : std::string_view{});
    }
  }

  cli::ScanToolCliArgs a{};
  std::string parseErr;
  if (!cli::ParseScanToolCliArgs(args, &a, &parseErr)) {
    if (!parseErr.empty() && parseErr.rfind("Usage:", 0) == 0) {
      std::cout << parseErr;
      return 0;
    }
    if (!parseErr.empty()) {
      std::cerr << "[CrashScanCli] " << parseErr << "\n";
    }
    std::cerr << cli::ScanToolCliUsage();
    return 2;
  }

  std::filesystem::path iniPath = a.config_path;
  if (iniPath.empty()) {
    const std::string envPath = ReadEnvString("CRASHSCAN_CONFIG");
    iniPath = envPath.empty() ? DefaultScanToolIniPath() : std::filesystem::path(envPath);
  }

  ScanToolConfig cfg{};
  std::string err;
  if (!LoadScanToolConfig(iniPath, &cfg, &err)) {
    std::cerr << "[CrashScanCli] LoadScanToolConfig failed: " << err << "\n";
    return 3;
  }
  ApplyCliOverrides(a, &cfg);

  if (!SetupScanToolLog(cfg.logDir, cfg.logLevel, &err)) {
    std::cerr << "[CrashScanCli] " << err << "\n";
    return 3;
  }
  if (!err.empty()) {
    spdlog::warn("CrashScan: {}", err);
  }
  spdlog::info("CrashScan: config={} rules={}", iniPath.string(), cfg.rulesPath.string());

  ScanRules rules{};
  if (!LoadScanRules(cfg.rulesPath, &rules, &err)) {
    spdlog::error("CrashScan: rule data rejected: {}", err);
    std::cerr << "[CrashScanCli] LoadScanRules failed: " << err << "\n";
    return 3;
  }

  if (a.audit_only) {
    return RunAuditOnly(cfg, rules);
  }

  FormIdDatabase formids;
  for (const auto& source : cfg.formIdSources) {
    if (!formids.AddSourceFile(source, &err)) {
      spdlog::warn("CrashScan: FormID source skipped {}: {}", source.string(), err);
    }
  }
  if (cfg.showFormIdValues && !formids.HasSources()) {
    spdlog::warn("CrashScan: ShowFormIdValues is on but no FormID source could be loaded");
  }

  const std::filesystem::path logDir = cfg.crashLogDir.empty() ? std::filesystem::current_path() : cfg.crashLogDir;
  const auto logs = DiscoverCrashLogs(logDir, cfg.scanCustomPath);
  if (logs.empty()) {
    std::cout << "No crash logs found in " << logDir.string() << "\n";
    return 0;
  }

  ScanSessionOptions opt{};
  opt.game_root = cfg.gameRootPath;
  opt.loadorder_path = cfg.loadOrderPath;
  opt.unsolved_logs_dir = cfg.unsolvedLogsDir;
  opt.move_unsolved_logs = cfg.moveUnsolvedLogs;
  opt.fcx_mode = cfg.fcxMode;
  opt.show_formid_values = cfg.showFormIdValues;
  opt.simplify_logs = cfg.simplifyLogs;
  opt.max_workers = cfg.maxWorkers;

  ScanSession session(rules, formids.HasSources() ? &formids : nullptr, opt);
  const ScanSummary summary = session.Run(logs);

  for (const auto& report : summary.reports) {
    std::cout << "Report: " << report.string() << "\n";
  }
  for (const auto& failed : summary.failed_logs) {
    std::cout << "Unsolved: " << failed.string() << "\n";
  }
  std::cout << "Scanned: " << summary.stats.scanned << "\n"
            << "Incomplete: " << summary.stats.incomplete << "\n"
            << "Failed: " << summary.stats.failed << "\n";
  if (!rules.hints.empty()) {
    std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<std::size_t> pick(0, rules.hints.size() - 1);
    std::cout << "\n" << rules.hints[pick(rng)] << "\n";
  }

  spdlog::shutdown();
  return summary.stats.failed > 0 ? 4 : 0;
}
