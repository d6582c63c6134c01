#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace crashscan::scan_tool {

struct ScanToolConfig {
  std::filesystem::path rulesPath = "data/CrashScanRules.json";
  std::filesystem::path crashLogDir;     // empty => working directory
  std::filesystem::path scanCustomPath;  // extra folder, top level only
  std::filesystem::path gameRootPath;
  std::filesystem::path loadOrderPath;
  std::vector<std::filesystem::path> formIdSources;
  bool fcxMode = false;
  bool showFormIdValues = false;
  bool simplifyLogs = false;
  bool moveUnsolvedLogs = false;
  std::filesystem::path unsolvedLogsDir = "CrashScan Backup/Unsolved Logs";
  std::size_t maxWorkers = 0;  // 0 = auto
  std::string logLevel = "info";
  std::filesystem::path logDir;  // empty => working directory
};

std::filesystem::path DefaultScanToolIniPath();

// A missing file is not an error: *out keeps the defaults. Malformed values fail with err naming the key.
bool LoadScanToolConfig(const std::filesystem::path& iniPath, ScanToolConfig* out, std::string* err);

}  // namespace crashscan::scan_tool
