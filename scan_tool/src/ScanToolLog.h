#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace crashscan::scan_tool {

// "trace" .. "off"; nullopt for anything else.
std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view text);

// Installs the default logger: <dir>/CrashScan.log (truncated) plus stderr.
// Falls back to stderr only when the log file cannot be created.
bool SetupScanToolLog(const std::filesystem::path& dir, std::string_view level, std::string* err);

}  // namespace crashscan::scan_tool
