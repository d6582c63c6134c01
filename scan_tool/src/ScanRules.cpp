#include "ScanRules.h"

#include <exception>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "TextFileUtil.h"

namespace crashscan::scan_tool {
namespace {

using Json = nlohmann::ordered_json;

std::vector<std::string> ReadStringArray(const Json& j, const char* key)
{
  std::vector<std::string> out;
  if (auto it = j.find(key); it != j.end() && it->is_array()) {
    out.reserve(it->size());
    for (const auto& v : *it) {
      if (v.is_string()) {
        out.push_back(v.get<std::string>());
      }
    }
  }
  return out;
}

RuleTextList ReadRuleTextMap(const Json& j, const char* key)
{
  RuleTextList out;
  if (auto it = j.find(key); it != j.end() && it->is_object()) {
    for (const auto& [k, v] : it->items()) {
      out.push_back(RuleText{ k, v.is_string() ? v.get<std::string>() : std::string{} });
    }
  }
  return out;
}

// Single-mod lists print their text as the whole finding, so an empty text is unusable.
bool RequireRuleTexts(const RuleTextList& list, const char* section, std::string* err)
{
  for (const auto& entry : list) {
    if (entry.text.empty()) {
      if (err) *err = std::string("empty warning text in rule data: ") + section + "." + entry.key;
      return false;
    }
  }
  return true;
}

bool RequireString(const Json& obj, const char* section, const char* key, std::string* dst, std::string* err)
{
  if (auto it = obj.find(key); it != obj.end() && it->is_string() && !it->get<std::string>().empty()) {
    *dst = it->get<std::string>();
    return true;
  }
  if (err) *err = std::string("missing required rule data: ") + section + "." + key;
  return false;
}

bool ParseSuspects(const Json& j, SuspectRules* suspects, std::string* err)
{
  const auto itError = j.find("suspects_error");
  if (itError == j.end() || !itError->is_object()) {
    if (err) *err = "missing required rule data: suspects_error";
    return false;
  }
  const auto itStack = j.find("suspects_stack");
  if (itStack == j.end() || !itStack->is_object()) {
    if (err) *err = "missing required rule data: suspects_stack";
    return false;
  }

  for (const auto& [key, signal] : itError->items()) {
    if (!signal.is_string()) {
      if (err) *err = "suspects_error." + key + " must be a string";
      return false;
    }
    if (!suspects->AddMainErrorRule(key, signal.get<std::string>(), err)) {
      return false;
    }
  }
  for (const auto& [key, list] : itStack->items()) {
    if (!list.is_array()) {
      if (err) *err = "suspects_stack." + key + " must be an array";
      return false;
    }
    std::vector<std::string> signals;
    signals.reserve(list.size());
    for (const auto& s : list) {
      if (s.is_string()) {
        signals.push_back(s.get<std::string>());
      }
    }
    if (!suspects->AddStackRule(key, signals, err)) {
      return false;
    }
  }
  return true;
}

}  // namespace

bool ParseScanRulesJson(std::string_view jsonUtf8, ScanRules* out, std::string* err)
{
  if (!out) {
    return false;
  }

  try {
    const auto j = Json::parse(jsonUtf8, nullptr, true);
    if (!j.is_object()) {
      if (err) *err = "rule data is not a JSON object";
      return false;
    }
    if (!j.contains("version") || !j["version"].is_number_unsigned()) {
      if (err) *err = "missing required rule data: version";
      return false;
    }

    ScanRules rules{};
    rules.version = j["version"].get<std::uint64_t>();

    if (auto it = j.find("scanner"); it != j.end() && it->is_object()) {
      rules.scanner_name = it->value("name", rules.scanner_name);
      rules.scanner_version = it->value("version", "");
      rules.scanner_version_date = it->value("version_date", "");
    }

    const auto itGame = j.find("game");
    if (itGame == j.end() || !itGame->is_object()) {
      if (err) *err = "missing required rule data: game";
      return false;
    }
    const auto& game = *itGame;
    if (!RequireString(game, "game", "crashgen_name", &rules.crashgen_name, err) ||
        !RequireString(game, "game", "root_name", &rules.game_root_name, err) ||
        !RequireString(game, "game", "xse_acronym", &rules.xse_acronym, err)) {
      return false;
    }
    rules.game_name = game.value("name", "");
    rules.crashgen_latest = game.value("crashgen_latest", "");
    rules.crashgen_latest_vr = game.value("crashgen_latest_vr", "");
    rules.crashgen_ignore = ReadStringArray(game, "crashgen_ignore");
    rules.game_version = game.value("game_version", "");
    rules.game_version_new = game.value("game_version_new", "");
    rules.game_version_vr = game.value("game_version_vr", "");
    rules.required_files = ReadStringArray(game, "required_files");

    const auto itWarnings = j.find("warnings");
    if (itWarnings == j.end() || !itWarnings->is_object()) {
      if (err) *err = "missing required rule data: warnings";
      return false;
    }
    if (!RequireString(*itWarnings, "warnings", "outdated", &rules.warn_outdated, err) ||
        !RequireString(*itWarnings, "warnings", "no_plugins", &rules.warn_no_plugins, err)) {
      return false;
    }

    rules.exclude_log_records = ReadStringArray(j, "exclude_log_records");
    rules.catch_log_records = ReadStringArray(j, "catch_log_records");
    rules.ignore_records = ReadStringArray(j, "ignore_records");
    rules.ignore_plugins = ReadStringArray(j, "ignore_plugins");
    rules.ignore_list = ReadStringArray(j, "ignore_list");

    if (!ParseSuspects(j, &rules.suspects, err)) {
      return false;
    }

    rules.mods_freq = ReadRuleTextMap(j, "mods_freq");
    rules.mods_conf = ReadRuleTextMap(j, "mods_conf");
    rules.mods_solu = ReadRuleTextMap(j, "mods_solu");
    rules.mods_opc2 = ReadRuleTextMap(j, "mods_opc2");
    rules.mods_core = ReadRuleTextMap(j, "mods_core");
    rules.mods_core_folon = ReadRuleTextMap(j, "mods_core_folon");
    if (!RequireRuleTexts(rules.mods_freq, "mods_freq", err) ||
        !RequireRuleTexts(rules.mods_solu, "mods_solu", err) ||
        !RequireRuleTexts(rules.mods_opc2, "mods_opc2", err)) {
      return false;
    }
    rules.autoscan_text = j.value("autoscan_text", "");
    rules.hints = ReadStringArray(j, "hints");

    *out = std::move(rules);
    return true;
  } catch (const std::exception& e) {
    if (err) *err = std::string("rule data parse error: ") + e.what();
    return false;
  }
}

bool LoadScanRules(const std::filesystem::path& jsonPath, ScanRules* out, std::string* err)
{
  const auto text = ReadWholeFile(jsonPath, err);
  if (!text) {
    return false;
  }
  if (!ParseScanRulesJson(*text, out, err)) {
    return false;
  }
  spdlog::info("CrashScan: rules loaded from {} (v{}, {} error suspects, {} stack suspects)",
               jsonPath.string(), out->version, out->suspects.MainErrorRuleCount(), out->suspects.StackRuleCount());
  return true;
}

}  // namespace crashscan::scan_tool
