#include "StackCorrelator.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>

#include "CrashScanStringUtil.h"
#include "FormIdDatabase.h"

namespace crashscan::scan_tool {
namespace {

const std::regex& FormIdRegex()
{
  static const std::regex re(
    R"(^(?!.*0xFF)(?=.*id:).*Form ID:\s*(?:0x)?([0-9A-F]{8}))",
    std::regex::ECMAScript | std::regex::icase);
  return re;
}

std::vector<CountedItem> CountSorted(const std::vector<std::string>& items)
{
  std::map<std::string, std::size_t> counts;
  for (const auto& item : items) {
    counts[item] += 1;
  }
  std::vector<CountedItem> out;
  out.reserve(counts.size());
  for (const auto& [text, count] : counts) {
    out.push_back(CountedItem{ text, count });
  }
  return out;
}

}  // namespace

std::vector<CountedItem> ScanNamedRecords(const std::vector<std::string>& callStack, const NamedRecordRules& rules)
{
  std::vector<std::string> matches;
  for (const auto& line : callStack) {
    const std::string lower = AsciiLower(line);
    const bool interesting = std::any_of(rules.records_lower.begin(), rules.records_lower.end(),
      [&](const std::string& r) { return !r.empty() && Contains(lower, r); });
    if (!interesting) {
      continue;
    }
    const bool ignored = std::any_of(rules.ignore_lower.begin(), rules.ignore_lower.end(),
      [&](const std::string& r) { return !r.empty() && Contains(lower, r); });
    if (ignored) {
      continue;
    }

    if (Contains(line, kRegisterDumpMarker)) {
      const std::string_view rest = line.size() > kRegisterDumpPrefixWidth
        ? std::string_view(line).substr(kRegisterDumpPrefixWidth)
        : std::string_view{};
      matches.emplace_back(TrimAscii(rest));
    } else {
      matches.emplace_back(TrimAscii(line));
    }
  }
  return CountSorted(matches);
}

std::vector<CountedItem> MatchPluginsInStack(
  const std::vector<std::string>& callStack,
  const PluginList& plugins,
  const std::vector<std::string>& ignorePluginsLower)
{
  std::vector<std::string> candidates;
  for (const auto& p : plugins) {
    std::string lower = AsciiLower(p.name);
    if (lower.empty() ||
        std::find(ignorePluginsLower.begin(), ignorePluginsLower.end(), lower) != ignorePluginsLower.end() ||
        std::find(candidates.begin(), candidates.end(), lower) != candidates.end()) {
      continue;
    }
    candidates.push_back(std::move(lower));
  }

  std::map<std::string, std::size_t> counts;
  for (const auto& line : callStack) {
    const std::string lower = AsciiLower(line);
    if (Contains(lower, "modified by:")) {
      continue;
    }
    for (const auto& plugin : candidates) {
      if (Contains(lower, plugin)) {
        counts[plugin] += 1;
      }
    }
  }

  std::vector<CountedItem> rows;
  rows.reserve(counts.size());
  for (const auto& [name, count] : counts) {
    rows.push_back(CountedItem{ name, count });
  }
  std::sort(rows.begin(), rows.end(), [](const CountedItem& a, const CountedItem& b) {
    if (a.count != b.count) {
      return a.count > b.count;
    }
    return a.text < b.text;
  });
  return rows;
}

std::vector<std::string> CollectFormIds(const std::vector<std::string>& callStack)
{
  std::vector<std::string> out;
  for (const auto& line : callStack) {
    std::smatch m;
    if (!std::regex_search(line, m, FormIdRegex())) {
      continue;
    }
    std::string id = m[1].str();
    for (auto& c : id) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    out.push_back("Form ID: " + id);
  }
  return out;
}

std::vector<FormIdRow> CorrelateFormIds(
  const std::vector<std::string>& formIds,
  const PluginList& plugins,
  const FormIdDatabase* db)
{
  std::vector<FormIdRow> rows;
  for (const auto& [full, count] : CountSorted(formIds)) {
    std::string label;
    std::string id;
    if (!SplitOnce(full, ": ", &label, &id) || id.size() < 2) {
      continue;
    }
    const std::string prefix = id.substr(0, 2);
    const std::string suffix = id.substr(2);

    for (const auto& plugin : plugins) {
      if (plugin.origin != prefix) {
        continue;
      }
      FormIdRow row{};
      row.formid_full = full;
      row.plugin = plugin.name;
      row.count = count;
      if (db && db->HasSources()) {
        row.description = db->Lookup(suffix, plugin.name);
      }
      rows.push_back(std::move(row));
      break;
    }
  }
  return rows;
}

void AppendPluginSuspects(ReportBuffer* report, const std::vector<CountedItem>& rows, std::string_view crashgenName)
{
  if (rows.empty()) {
    report->Append("* COULDN'T FIND ANY PLUGIN SUSPECTS *\n\n");
    return;
  }
  report->Append("The following PLUGINS were found in the CRASH STACK:\n");
  for (const auto& row : rows) {
    report->Append("- " + row.text + " | " + std::to_string(row.count) + "\n");
  }
  report->Append("\n[Last number counts how many times each Plugin Suspect shows up in the crash log.]\n");
  report->Append("These Plugins were caught by " + std::string(crashgenName) +
                 " and some of them might be responsible for this crash.\n");
  report->Append("You can try disabling these plugins and check if the game still crashes, though this method can be unreliable.\n\n");
}

void AppendFormIdSuspects(ReportBuffer* report, bool anyFormIds, const std::vector<FormIdRow>& rows, std::string_view crashgenName)
{
  if (!anyFormIds) {
    report->Append("* COULDN'T FIND ANY FORM ID SUSPECTS *\n\n");
    return;
  }
  for (const auto& row : rows) {
    if (row.description) {
      report->Append("- " + row.formid_full + " | [" + row.plugin + "] | " + *row.description + " | " +
                     std::to_string(row.count) + "\n");
    } else {
      report->Append("- " + row.formid_full + " | [" + row.plugin + "] | " + std::to_string(row.count) + "\n");
    }
  }
  report->Append("\n[Last number counts how many times each Form ID shows up in the crash log.]\n");
  report->Append("These Form IDs were caught by " + std::string(crashgenName) +
                 " and some of them might be related to this crash.\n");
  report->Append("You can try searching any listed Form IDs in xEdit and see if they lead to relevant records.\n\n");
}

void AppendNamedRecords(ReportBuffer* report, const std::vector<CountedItem>& rows, std::string_view crashgenName)
{
  if (rows.empty()) {
    report->Append("* COULDN'T FIND ANY NAMED RECORDS *\n\n");
    return;
  }
  for (const auto& row : rows) {
    report->Append("- " + row.text + " | " + std::to_string(row.count) + "\n");
  }
  report->Append("\n[Last number counts how many times each Named Record shows up in the crash log.]\n");
  report->Append("These records were caught by " + std::string(crashgenName) +
                 " and some of them might be related to this crash.\n");
  report->Append("Named records should give extra info on involved game objects, record types or mod files.\n\n");
}

}  // namespace crashscan::scan_tool
