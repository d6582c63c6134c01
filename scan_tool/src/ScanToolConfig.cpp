#include "ScanToolConfig.h"

#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "CrashScanStringUtil.h"
#include "IniDocument.h"

namespace crashscan::scan_tool {
namespace {

constexpr std::string_view kSection = "CrashScan";

void ReadPath(const IniDocument& ini, std::string_view key, std::filesystem::path* dst)
{
  if (auto v = ini.Get(kSection, key); v && !v->empty()) {
    *dst = std::filesystem::path(*v);
  }
}

bool ReadBool(const IniDocument& ini, std::string_view key, bool* dst, std::string* err)
{
  if (!ini.Has(kSection, key)) {
    return true;
  }
  const auto v = ini.GetBool(kSection, key);
  if (!v) {
    if (err) {
      *err = "invalid boolean for " + std::string(key) + ": " + ini.Get(kSection, key).value_or("");
    }
    return false;
  }
  *dst = *v;
  return true;
}

std::vector<std::filesystem::path> SplitSourceList(std::string_view text)
{
  std::vector<std::filesystem::path> out;
  std::size_t start = 0;
  while (start <= text.size()) {
    auto bar = text.find('|', start);
    if (bar == std::string_view::npos) {
      bar = text.size();
    }
    const std::string_view item = TrimAscii(text.substr(start, bar - start));
    if (!item.empty()) {
      out.emplace_back(std::string(item));
    }
    start = bar + 1;
  }
  return out;
}

}  // namespace

std::filesystem::path DefaultScanToolIniPath()
{
  return std::filesystem::path("CrashScan.ini");
}

bool LoadScanToolConfig(const std::filesystem::path& iniPath, ScanToolConfig* out, std::string* err)
{
  if (!out) {
    if (err) *err = "config output is null";
    return false;
  }
  if (err) err->clear();

  std::error_code ec;
  if (!std::filesystem::exists(iniPath, ec)) {
    return true;
  }

  IniDocument ini;
  if (!ini.LoadFromFile(iniPath, err)) {
    return false;
  }

  ScanToolConfig cfg = *out;
  ReadPath(ini, "RulesPath", &cfg.rulesPath);
  ReadPath(ini, "CrashLogDir", &cfg.crashLogDir);
  ReadPath(ini, "ScanCustomPath", &cfg.scanCustomPath);
  ReadPath(ini, "GameRootPath", &cfg.gameRootPath);
  ReadPath(ini, "LoadOrderPath", &cfg.loadOrderPath);
  ReadPath(ini, "UnsolvedLogsDir", &cfg.unsolvedLogsDir);
  ReadPath(ini, "LogDir", &cfg.logDir);

  if (auto v = ini.Get(kSection, "FormIdSources")) {
    cfg.formIdSources = SplitSourceList(*v);
  }

  if (!ReadBool(ini, "FcxMode", &cfg.fcxMode, err) ||
      !ReadBool(ini, "ShowFormIdValues", &cfg.showFormIdValues, err) ||
      !ReadBool(ini, "SimplifyLogs", &cfg.simplifyLogs, err) ||
      !ReadBool(ini, "MoveUnsolvedLogs", &cfg.moveUnsolvedLogs, err)) {
    return false;
  }

  if (ini.Has(kSection, "MaxWorkers")) {
    const auto workers = ini.GetInt(kSection, "MaxWorkers");
    if (!workers || *workers < 0 || *workers > 4096) {
      if (err) *err = "invalid MaxWorkers: " + ini.Get(kSection, "MaxWorkers").value_or("");
      return false;
    }
    cfg.maxWorkers = static_cast<std::size_t>(*workers);
  }

  if (auto v = ini.Get(kSection, "LogLevel"); v && !v->empty()) {
    cfg.logLevel = AsciiLower(*v);
  }

  *out = std::move(cfg);
  return true;
}

}  // namespace crashscan::scan_tool
