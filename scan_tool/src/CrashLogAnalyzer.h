#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "OnceValue.h"
#include "ScanRules.h"

namespace crashscan::scan_tool {

class FormIdDatabase;

// Crash logs shorter than this are too truncated to analyze.
inline constexpr std::size_t kMinCrashLogLines = 20;
inline constexpr std::size_t kSuspectNameWidth = 30;

struct ScanStats
{
  std::size_t scanned = 0;
  std::size_t incomplete = 0;
  std::size_t failed = 0;

  ScanStats& operator+=(const ScanStats& other)
  {
    scanned += other.scanned;
    incomplete += other.incomplete;
    failed += other.failed;
    return *this;
  }
};

// Result of the once-per-session game folder check.
struct IntegrityCheckResult
{
  std::string main_files;
  std::string game_files;
};

struct AnalyzerOptions
{
  bool fcx_mode = false;
  bool show_formid_values = false;
  std::filesystem::path loadorder_path;  // used instead of the log's plugin list when the file exists
};

// Shared, read-only inputs of every log analysis in one session.
struct ScanContext
{
  const ScanRules* rules = nullptr;
  const FormIdDatabase* formids = nullptr;
  AnalyzerOptions options;
  OnceValue<IntegrityCheckResult>* integrity = nullptr;
  std::function<IntegrityCheckResult()> run_integrity_check;
};

struct CrashLogScanResult
{
  std::filesystem::path log_path;
  std::string report;
  bool scan_failed = false;
  ScanStats stats;
};

// "<name> <version>" as printed in report headers and footers.
std::string ScannerLabel(const ScanRules& rules);

// Builds the full report of one crash log. May throw on unexpected internal errors;
// the session treats that as a failed log.
CrashLogScanResult AnalyzeCrashLog(
  const std::filesystem::path& logPath,
  const std::vector<std::string>& lines,
  const ScanContext& ctx);

}  // namespace crashscan::scan_tool
