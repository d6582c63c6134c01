#include "ScanToolLog.h"

#include <memory>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "CrashScanStringUtil.h"

namespace crashscan::scan_tool {

std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view text)
{
  const std::string lower = AsciiLower(TrimAscii(text));
  if (lower == "trace") {
    return spdlog::level::trace;
  }
  if (lower == "debug") {
    return spdlog::level::debug;
  }
  if (lower == "info") {
    return spdlog::level::info;
  }
  if (lower == "warn" || lower == "warning") {
    return spdlog::level::warn;
  }
  if (lower == "error" || lower == "err") {
    return spdlog::level::err;
  }
  if (lower == "critical") {
    return spdlog::level::critical;
  }
  if (lower == "off") {
    return spdlog::level::off;
  }
  return std::nullopt;
}

bool SetupScanToolLog(const std::filesystem::path& dir, std::string_view level, std::string* err)
{
  if (err) err->clear();

  const auto parsed = ParseLogLevel(level);
  if (!parsed) {
    if (err) *err = "invalid LogLevel: " + std::string(level);
    return false;
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  std::filesystem::path path = dir.empty() ? std::filesystem::current_path() : dir;
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  path /= "CrashScan.log";
  try {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true));
  } catch (const spdlog::spdlog_ex& e) {
    if (err) *err = std::string("log file unavailable: ") + e.what();
  }

  auto logger = std::make_shared<spdlog::logger>("global log", sinks.begin(), sinks.end());
  spdlog::set_default_logger(std::move(logger));
  spdlog::set_level(*parsed);
  spdlog::flush_on(spdlog::level::info);
  return true;
}

}  // namespace crashscan::scan_tool
