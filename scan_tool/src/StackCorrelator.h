#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "PluginLoadOrder.h"
#include "ReportBuffer.h"

namespace crashscan::scan_tool {

class FormIdDatabase;

struct CountedItem
{
  std::string text;
  std::size_t count = 0;
};

struct NamedRecordRules
{
  std::vector<std::string> records_lower;  // interesting substrings
  std::vector<std::string> ignore_lower;   // any of these excludes the line
};

// Register dump lines ("[RSP+...]") carry a fixed-width prefix that is cut before recording.
inline constexpr std::string_view kRegisterDumpMarker = "[RSP+";
inline constexpr std::size_t kRegisterDumpPrefixWidth = 30;

// Sorted by record text ascending.
std::vector<CountedItem> ScanNamedRecords(const std::vector<std::string>& callStack, const NamedRecordRules& rules);

// Sorted by count descending, then name ascending. Names are case-folded.
std::vector<CountedItem> MatchPluginsInStack(
  const std::vector<std::string>& callStack,
  const PluginList& plugins,
  const std::vector<std::string>& ignorePluginsLower);

// "Form ID: XXXXXXXX" for every call stack line referencing a non-dynamic FormID.
std::vector<std::string> CollectFormIds(const std::vector<std::string>& callStack);

struct FormIdRow
{
  std::string formid_full;  // "Form ID: 2A001234"
  std::string plugin;
  std::optional<std::string> description;
  std::size_t count = 0;
};

// FormIDs whose prefix matches no plugin id are omitted. db == nullptr disables descriptions.
std::vector<FormIdRow> CorrelateFormIds(
  const std::vector<std::string>& formIds,
  const PluginList& plugins,
  const FormIdDatabase* db);

void AppendPluginSuspects(ReportBuffer* report, const std::vector<CountedItem>& rows, std::string_view crashgenName);
void AppendFormIdSuspects(ReportBuffer* report, bool anyFormIds, const std::vector<FormIdRow>& rows, std::string_view crashgenName);
void AppendNamedRecords(ReportBuffer* report, const std::vector<CountedItem>& rows, std::string_view crashgenName);

}  // namespace crashscan::scan_tool
