#pragma once

#include <optional>
#include <string>

#include "PluginLoadOrder.h"
#include "ReportBuffer.h"
#include "ScanRules.h"

namespace crashscan::scan_tool {

// key: mod name fragment. Reports "[!] FOUND : [<origin>] <text>" for the first plugin
// containing the fragment (case-insensitive). Returns true when anything was reported.
bool DetectModsSingle(const RuleTextList& mods, const PluginList& plugins, ReportBuffer* report);

// key: "<mod a> | <mod b>". Both fragments must match some plugin.
bool DetectModsDouble(const RuleTextList& mods, const PluginList& plugins, ReportBuffer* report);

// key: "<mod id> | <display name>". Reports installed / missing state for every entry.
// gpuRival ("amd" / "nvidia") suppresses advice for mods that only target the other vendor.
// With no detected GPU every missing entry is reported.
void DetectModsImportant(
  const RuleTextList& mods,
  const PluginList& plugins,
  const std::optional<std::string>& gpuRival,
  ReportBuffer* report);

}  // namespace crashscan::scan_tool
