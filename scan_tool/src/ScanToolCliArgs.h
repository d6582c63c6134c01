#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crashscan::scan_tool::cli {

struct ScanToolCliArgs
{
  std::string config_path;  // empty => CrashScan.ini in the working directory

  // Unset values fall back to the INI.
  std::optional<std::string> rules_path;
  std::optional<std::string> logs_dir;
  std::optional<std::string> game_root;
  std::optional<std::string> loadorder_path;
  std::vector<std::string> formid_sources;
  std::optional<std::size_t> workers;
  std::optional<bool> fcx_mode;
  std::optional<bool> show_formid_values;
  std::optional<bool> simplify_logs;

  bool audit_only = false;
};

inline std::string ScanToolCliUsage()
{
  return
    "Usage:\n"
    "  CrashScanCli [options]\n"
    "\n"
    "Options:\n"
    "  --config <ini>             Tool settings (default: CrashScan.ini)\n"
    "  --rules <json>             Rule dataset (overrides RulesPath)\n"
    "  --logs <dir>               Crash log folder (overrides CrashLogDir)\n"
    "  --game-root <dir>          Game installation folder\n"
    "  --loadorder <file>         Load order file used instead of the log plugin list\n"
    "  --formid-db <file>         FormID description source (repeatable)\n"
    "  --workers <n>              Worker thread count (0 = auto)\n"
    "  --fcx                      Check game files and configs once per run\n"
    "  --show-formid-values       Describe FormIDs found in call stacks\n"
    "  --simplify                 Drop excluded record lines from logs\n"
    "  --audit-only               Only run the game config audit\n"
    "  --help                     Show this help\n";
}

inline bool ParseScanToolCliArgs(const std::vector<std::string_view>& argv, ScanToolCliArgs* out, std::string* err)
{
  if (out) {
    *out = ScanToolCliArgs{};
  }
  if (err) {
    err->clear();
  }
  if (!out) {
    return false;
  }

  const std::size_t n = argv.size();
  std::size_t i = 0;
  if (n > 0) {
    i = 1;  // skip program name for normal argv
  }

  auto takeValue = [&](std::string_view option, std::string* dst) {
    if (i + 1 >= n || argv[i + 1].empty()) {
      if (err) {
        *err = std::string(option) + " requires a value";
      }
      return false;
    }
    *dst = std::string(argv[++i]);
    return true;
  };

  for (; i < n; i++) {
    const std::string_view a = argv[i];
    if (a.empty()) {
      continue;
    }

    if (a == "--help" || a == "-h") {
      if (err) {
        *err = ScanToolCliUsage();
      }
      return false;
    }

    if (a == "--fcx") {
      out->fcx_mode = true;
      continue;
    }

    if (a == "--show-formid-values") {
      out->show_formid_values = true;
      continue;
    }

    if (a == "--simplify") {
      out->simplify_logs = true;
      continue;
    }

    if (a == "--audit-only") {
      out->audit_only = true;
      continue;
    }

    std::string value;
    if (a == "--config") {
      if (!takeValue(a, &out->config_path)) {
        return false;
      }
      continue;
    }
    if (a == "--rules") {
      if (!takeValue(a, &value)) {
        return false;
      }
      out->rules_path = value;
      continue;
    }
    if (a == "--logs") {
      if (!takeValue(a, &value)) {
        return false;
      }
      out->logs_dir = value;
      continue;
    }
    if (a == "--game-root") {
      if (!takeValue(a, &value)) {
        return false;
      }
      out->game_root = value;
      continue;
    }
    if (a == "--loadorder") {
      if (!takeValue(a, &value)) {
        return false;
      }
      out->loadorder_path = value;
      continue;
    }
    if (a == "--formid-db") {
      if (!takeValue(a, &value)) {
        return false;
      }
      out->formid_sources.push_back(value);
      continue;
    }

    if (a == "--workers") {
      if (!takeValue(a, &value)) {
        return false;
      }
      std::size_t count = 0;
      for (const char c : value) {
        if (c < '0' || c > '9' || count > 4096) {
          if (err) {
            *err = "--workers expects a number between 0 and 4096: " + value;
          }
          return false;
        }
        count = (count * 10) + static_cast<std::size_t>(c - '0');
      }
      if (count > 4096) {
        if (err) {
          *err = "--workers expects a number between 0 and 4096: " + value;
        }
        return false;
      }
      out->workers = count;
      continue;
    }

    if (err) {
      if (a[0] == '-') {
        *err = std::string("Unknown option: ") + std::string(a);
      } else {
        *err = std::string("Unexpected positional argument: ") + std::string(a);
      }
    }
    return false;
  }

  return true;
}

}  // namespace crashscan::scan_tool::cli
