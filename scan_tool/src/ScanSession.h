#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "CrashLogAnalyzer.h"
#include "LogCache.h"
#include "OnceValue.h"

namespace crashscan::scan_tool {

inline constexpr std::size_t kMaxDefaultWorkers = 8;

struct ScanSessionOptions
{
  std::filesystem::path game_root;
  std::filesystem::path loadorder_path;
  std::filesystem::path unsolved_logs_dir;
  bool move_unsolved_logs = false;
  bool fcx_mode = false;
  bool show_formid_values = false;
  bool simplify_logs = false;
  std::size_t max_workers = 0;  // 0 = min(hardware threads, kMaxDefaultWorkers)
};

struct ScanSummary
{
  ScanStats stats;
  std::vector<std::filesystem::path> reports;
  std::vector<std::filesystem::path> failed_logs;
  std::size_t worker_count = 0;
};

// crash-*.log under crashLogDir (recursive) and customPath (top level only), sorted, without duplicates.
std::vector<std::filesystem::path> DiscoverCrashLogs(const std::filesystem::path& crashLogDir, const std::filesystem::path& customPath);

std::size_t ResolveWorkerCount(std::size_t configured, std::size_t logCount);

// "<dir>/<stem>-AUTOSCAN.md"
std::filesystem::path ReportPathFor(const std::filesystem::path& logPath);

bool CopyUnsolvedLog(const std::filesystem::path& logPath, const std::filesystem::path& unsolvedDir, std::string* err);

// One scan over a fixed set of crash logs. Owns the log cache and the once-only
// game folder check shared by all workers.
class ScanSession
{
public:
  ScanSession(const ScanRules& rules, const FormIdDatabase* formids, ScanSessionOptions options);

  ScanSummary Run(const std::vector<std::filesystem::path>& logs);

  // Main files + config audit of the game root. Runs on every call.
  IntegrityCheckResult RunIntegrityCheck() const;
  std::size_t IntegrityCheckRuns() const;

private:
  void PrepareLogs(const std::vector<std::filesystem::path>& logs);
  CrashLogScanResult ScanOne(const std::filesystem::path& logPath, const ScanContext& ctx) const;

  const ScanRules& m_rules;
  const FormIdDatabase* m_formids = nullptr;
  ScanSessionOptions m_options;
  LogCache m_cache;
  OnceValue<IntegrityCheckResult> m_integrity;
  mutable std::atomic<std::size_t> m_integrityRuns{ 0 };
};

}  // namespace crashscan::scan_tool
