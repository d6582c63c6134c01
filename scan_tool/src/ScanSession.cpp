#include "ScanSession.h"

#include <algorithm>
#include <deque>
#include <exception>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "ConfigAuditor.h"
#include "CrashLogReformat.h"
#include "CrashScanStringUtil.h"
#include "TextFileUtil.h"

namespace crashscan::scan_tool {
namespace {

namespace fs = std::filesystem;

bool IsCrashLogName(const std::string& name)
{
  return StartsWith(name, "crash-") && name.size() > 4 && name.substr(name.size() - 4) == ".log";
}

void CollectLogs(const fs::path& dir, bool recursive, std::vector<fs::path>* out)
{
  std::error_code ec;
  if (dir.empty() || !fs::is_directory(dir, ec)) {
    return;
  }
  auto consider = [&](const fs::directory_entry& entry) {
    std::error_code fileEc;
    if (entry.is_regular_file(fileEc) && IsCrashLogName(entry.path().filename().string())) {
      out->push_back(entry.path());
    }
  };
  if (recursive) {
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
      consider(*it);
    }
  } else {
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
      consider(*it);
    }
  }
  if (ec) {
    spdlog::warn("CrashScan: crash log discovery stopped early in {}: {}", dir.string(), ec.message());
  }
}

}  // namespace

std::vector<fs::path> DiscoverCrashLogs(const fs::path& crashLogDir, const fs::path& customPath)
{
  std::vector<fs::path> out;
  CollectLogs(crashLogDir, true, &out);
  CollectLogs(customPath, false, &out);
  for (auto& p : out) {
    p = p.lexically_normal();
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

std::size_t ResolveWorkerCount(std::size_t configured, std::size_t logCount)
{
  std::size_t n = configured;
  if (n == 0) {
    const std::size_t hw = std::thread::hardware_concurrency();
    n = std::min<std::size_t>(hw == 0 ? 4 : hw, kMaxDefaultWorkers);
  }
  return std::max<std::size_t>(1, std::min(n, std::max<std::size_t>(logCount, 1)));
}

fs::path ReportPathFor(const fs::path& logPath)
{
  return logPath.parent_path() / (logPath.stem().string() + "-AUTOSCAN.md");
}

bool CopyUnsolvedLog(const fs::path& logPath, const fs::path& unsolvedDir, std::string* err)
{
  std::error_code ec;
  fs::create_directories(unsolvedDir, ec);
  if (ec) {
    if (err) *err = "cannot create " + unsolvedDir.string() + ": " + ec.message();
    return false;
  }
  const fs::path report = ReportPathFor(logPath);
  for (const auto& src : { logPath, report }) {
    if (!fs::exists(src, ec)) {
      continue;
    }
    fs::copy_file(src, unsolvedDir / src.filename(), fs::copy_options::overwrite_existing, ec);
    if (ec) {
      if (err) *err = "cannot copy " + src.string() + ": " + ec.message();
      return false;
    }
  }
  return true;
}

ScanSession::ScanSession(const ScanRules& rules, const FormIdDatabase* formids, ScanSessionOptions options)
  : m_rules(rules), m_formids(formids), m_options(std::move(options))
{
}

IntegrityCheckResult ScanSession::RunIntegrityCheck() const
{
  m_integrityRuns.fetch_add(1);
  spdlog::info("CrashScan: running game folder check on {}", m_options.game_root.string());

  IntegrityCheckResult out{};
  out.main_files = CheckRequiredGameFiles(m_options.game_root, m_rules.required_files);

  ConfigAuditOptions audit{};
  audit.game_root = m_options.game_root;
  audit.game_name = m_rules.game_name;
  std::string err;
  if (!AuditGameConfigFiles(audit, &out.game_files, &err)) {
    spdlog::warn("CrashScan: config audit skipped: {}", err);
    out.game_files.clear();
  }
  return out;
}

std::size_t ScanSession::IntegrityCheckRuns() const
{
  return m_integrityRuns.load();
}

void ScanSession::PrepareLogs(const std::vector<fs::path>& logs)
{
  ReformatOptions reformat{};
  reformat.simplify = m_options.simplify_logs;
  reformat.remove_substrings = m_rules.exclude_log_records;

  for (const auto& path : logs) {
    std::string err;
    if (!ReformatCrashLogFile(path, reformat, &err)) {
      spdlog::warn("CrashScan: reformat skipped for {}: {}", path.string(), err);
    }
    if (!m_cache.AddFile(path, &err)) {
      spdlog::error("CrashScan: cannot read crash log {}: {}", path.string(), err);
    }
  }
}

CrashLogScanResult ScanSession::ScanOne(const fs::path& logPath, const ScanContext& ctx) const
{
  const auto lines = m_cache.ReadLines(logPath);
  if (!lines) {
    CrashLogScanResult failed{};
    failed.log_path = logPath;
    failed.scan_failed = true;
    failed.stats.failed = 1;
    return failed;
  }
  return AnalyzeCrashLog(logPath, *lines, ctx);
}

ScanSummary ScanSession::Run(const std::vector<fs::path>& logs)
{
  ScanSummary summary{};
  summary.worker_count = ResolveWorkerCount(m_options.max_workers, logs.size());
  spdlog::info("CrashScan: scanning {} crash logs with {} workers", logs.size(), summary.worker_count);

  PrepareLogs(logs);

  ScanContext ctx{};
  ctx.rules = &m_rules;
  ctx.formids = m_formids;
  ctx.options.fcx_mode = m_options.fcx_mode;
  ctx.options.show_formid_values = m_options.show_formid_values;
  ctx.options.loadorder_path = m_options.loadorder_path;
  ctx.integrity = &m_integrity;
  ctx.run_integrity_check = [this]() { return RunIntegrityCheck(); };

  std::mutex mutex;
  std::deque<fs::path> pending(logs.begin(), logs.end());

  auto finish = [&](const fs::path& logPath, const CrashLogScanResult& result) {
    bool failed = result.scan_failed;
    fs::path reportPath;
    if (!result.report.empty()) {
      reportPath = ReportPathFor(logPath);
      std::string err;
      if (!WriteWholeFile(reportPath, result.report, &err)) {
        spdlog::error("CrashScan: cannot write report {}: {}", reportPath.string(), err);
        reportPath.clear();
      }
    }
    if (failed && m_options.move_unsolved_logs && !m_options.unsolved_logs_dir.empty()) {
      std::string err;
      if (!CopyUnsolvedLog(logPath, m_options.unsolved_logs_dir, &err)) {
        spdlog::warn("CrashScan: {}", err);
      }
    }

    std::lock_guard lock(mutex);
    summary.stats += result.stats;
    if (!reportPath.empty()) {
      summary.reports.push_back(reportPath);
    }
    if (failed) {
      summary.failed_logs.push_back(logPath);
    }
  };

  auto workerMain = [&]() {
    for (;;) {
      fs::path logPath;
      {
        std::lock_guard lock(mutex);
        if (pending.empty()) {
          return;
        }
        logPath = std::move(pending.front());
        pending.pop_front();
      }

      std::string failure;
      try {
        finish(logPath, ScanOne(logPath, ctx));
        continue;
      } catch (const std::exception& e) {
        failure = e.what();
      } catch (...) {
        failure = "unknown exception";
      }
      spdlog::error("CrashScan: scan of {} failed: {}", logPath.string(), failure);

      CrashLogScanResult failed{};
      failed.log_path = logPath;
      failed.scan_failed = true;
      failed.stats.failed = 1;
      try {
        finish(logPath, failed);
      } catch (const std::exception& e) {
        spdlog::error("CrashScan: cannot record failed log {}: {}", logPath.string(), e.what());
        std::lock_guard lock(mutex);
        summary.stats += failed.stats;
        summary.failed_logs.push_back(logPath);
      }
    }
  };

  std::vector<std::thread> workers;
  workers.reserve(summary.worker_count);
  for (std::size_t i = 0; i < summary.worker_count; i++) {
    workers.emplace_back(workerMain);
  }
  for (auto& t : workers) {
    t.join();
  }

  std::sort(summary.reports.begin(), summary.reports.end());
  std::sort(summary.failed_logs.begin(), summary.failed_logs.end());
  spdlog::info("CrashScan: scan finished: scanned {}, incomplete {}, failed {}",
               summary.stats.scanned, summary.stats.incomplete, summary.stats.failed);
  return summary;
}

}  // namespace crashscan::scan_tool
