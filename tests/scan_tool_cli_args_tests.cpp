#include <cassert>
#include <string>
#include <string_view>
#include <vector>

#include "ScanToolCliArgs.h"

namespace {

using crashscan::scan_tool::cli::ParseScanToolCliArgs;
using crashscan::scan_tool::cli::ScanToolCliArgs;

void TestDefaults()
{
  ScanToolCliArgs args{};
  std::string err;
  assert(ParseScanToolCliArgs({ "CrashScanCli.exe" }, &args, &err));
  assert(err.empty());
  assert(args.config_path.empty());
  assert(!args.rules_path.has_value());
  assert(!args.workers.has_value());
  assert(!args.fcx_mode.has_value());
  assert(args.formid_sources.empty());
  assert(!args.audit_only);

  assert(ParseScanToolCliArgs({}, &args, &err));
  assert(!ParseScanToolCliArgs({ "CrashScanCli.exe" }, nullptr, &err));
}

void TestAllOptions()
{
  ScanToolCliArgs args{};
  std::string err;
  const std::vector<std::string_view> argv = {
    "CrashScanCli.exe",
    "--config", "tool.ini",
    "--rules", "rules.json",
    "--logs", "C:/Logs",
    "--game-root", "D:/Games/Fallout 4",
    "--loadorder", "loadorder.txt",
    "--formid-db", "a.txt",
    "--formid-db", "b.txt",
    "--workers", "12",
    "--fcx",
    "--show-formid-values",
    "--simplify",
    "--audit-only",
  };
  assert(ParseScanToolCliArgs(argv, &args, &err));
  assert(args.config_path == "tool.ini");
  assert(args.rules_path == "rules.json");
  assert(args.logs_dir == "C:/Logs");
  assert(args.game_root == "D:/Games/Fallout 4");
  assert(args.loadorder_path == "loadorder.txt");
  assert(args.formid_sources.size() == 2);
  assert(args.formid_sources[1] == "b.txt");
  assert(args.workers == 12u);
  assert(args.fcx_mode == true);
  assert(args.show_formid_values == true);
  assert(args.simplify_logs == true);
  assert(args.audit_only);
}

void TestHelpReturnsUsage()
{
  ScanToolCliArgs args{};
  std::string err;
  assert(!ParseScanToolCliArgs({ "CrashScanCli.exe", "--fcx", "-h" }, &args, &err));
  assert(err.rfind("Usage:", 0) == 0);
  assert(err.find("--formid-db") != std::string::npos);
}

void TestErrors()
{
  ScanToolCliArgs args{};
  std::string err;

  assert(!ParseScanToolCliArgs({ "CrashScanCli.exe", "--rules" }, &args, &err));
  assert(err == "--rules requires a value");

  assert(!ParseScanToolCliArgs({ "CrashScanCli.exe", "--logs", "" }, &args, &err));
  assert(err == "--logs requires a value");

  assert(!ParseScanToolCliArgs({ "CrashScanCli.exe", "--workers", "4x" }, &args, &err));
  assert(err == "--workers expects a number between 0 and 4096: 4x");

  assert(!ParseScanToolCliArgs({ "CrashScanCli.exe", "--workers", "4097" }, &args, &err));
  assert(err == "--workers expects a number between 0 and 4096: 4097");

  assert(!ParseScanToolCliArgs({ "CrashScanCli.exe", "--workers", "99999999999999999999999" }, &args, &err));
  assert(err.rfind("--workers expects", 0) == 0);

  assert(ParseScanToolCliArgs({ "CrashScanCli.exe", "--workers", "0" }, &args, &err));
  assert(args.workers == 0u);

  assert(!ParseScanToolCliArgs({ "CrashScanCli.exe", "--verbose" }, &args, &err));
  assert(err == "Unknown option: --verbose");

  assert(!ParseScanToolCliArgs({ "CrashScanCli.exe", "crash.log" }, &args, &err));
  assert(err == "Unexpected positional argument: crash.log");
}

}  // namespace

int main()
{
  TestDefaults();
  TestAllOptions();
  TestHelpReturnsUsage();
  TestErrors();
  return 0;
}
