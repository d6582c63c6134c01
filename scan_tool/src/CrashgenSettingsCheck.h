#pragma once

#include <set>
#include <string>
#include <vector>

#include "CrashLogParseCore.h"
#include "ReportBuffer.h"

namespace crashscan::scan_tool {

struct CrashgenCheckContext
{
  std::string crashgen_name;                  // "Buffout 4"
  std::string crashgen_version;               // version token from the log
  std::string crashgen_latest;                // rule data
  std::set<std::string> ignored_settings;     // crashgen_ignore plus memory-mod additions
  const std::set<std::string>* xse_modules = nullptr;
};

struct MemoryModPresence
{
  bool x_cell = false;
  bool baka_scrapheap = false;
};

MemoryModPresence DetectMemoryMods(const std::set<std::string>& xseModules);

// X-Cell replaces every crashgen allocator; Baka ScrapHeap only the main one.
void AddMemoryModIgnores(const MemoryModPresence& mods, std::set<std::string>* ignoredSettings);

// Appends the crash generator settings section. No-op for an empty settings list.
void AppendCrashgenSettingsChecks(
  const crashlog_core::CrashgenSettings& settings,
  const CrashgenCheckContext& ctx,
  ReportBuffer* report);

}  // namespace crashscan::scan_tool
