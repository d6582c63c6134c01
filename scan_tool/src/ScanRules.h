#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "SuspectRules.h"

namespace crashscan::scan_tool {

// One entry of an ordered "key -> text" rule map.
struct RuleText
{
  std::string key;
  std::string text;
};

using RuleTextList = std::vector<RuleText>;

// Curated rule dataset. Read-only for the duration of a scan.
struct ScanRules
{
  std::uint64_t version = 0;

  std::string scanner_name = "CrashScan";
  std::string scanner_version;
  std::string scanner_version_date;

  std::string game_name;       // "Fallout4"
  std::string game_root_name;  // log header prefix, "Fallout 4"
  std::string xse_acronym;     // "F4SE"
  std::string crashgen_name;   // "Buffout 4"
  std::string crashgen_latest;
  std::string crashgen_latest_vr;
  std::vector<std::string> crashgen_ignore;
  std::string game_version;
  std::string game_version_new;
  std::string game_version_vr;
  std::vector<std::string> required_files;

  std::string warn_outdated;
  std::string warn_no_plugins;

  std::vector<std::string> exclude_log_records;
  std::vector<std::string> catch_log_records;
  std::vector<std::string> ignore_records;
  std::vector<std::string> ignore_plugins;
  std::vector<std::string> ignore_list;

  SuspectRules suspects;

  RuleTextList mods_freq;
  RuleTextList mods_conf;
  RuleTextList mods_solu;
  RuleTextList mods_opc2;
  RuleTextList mods_core;
  RuleTextList mods_core_folon;

  std::string autoscan_text;
  std::vector<std::string> hints;
};

// Fails (with err naming the key) when the document is malformed or mandatory data is missing.
bool ParseScanRulesJson(std::string_view jsonUtf8, ScanRules* out, std::string* err);
bool LoadScanRules(const std::filesystem::path& jsonPath, ScanRules* out, std::string* err);

}  // namespace crashscan::scan_tool
