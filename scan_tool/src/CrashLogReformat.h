#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace crashscan::scan_tool {

struct ReformatOptions
{
  bool simplify = false;
  std::vector<std::string> remove_substrings;  // only used when simplify is set
};

// Normalizes load order brackets in the trailing PLUGINS section ("[ 1]" -> "[01]")
// and optionally drops lines containing any remove substring. Idempotent.
std::vector<std::string> ReformatCrashLogLines(const std::vector<std::string>& lines, const ReformatOptions& opt);

// Rewrites the file in place. Returns false (with err) when it cannot be read or written.
bool ReformatCrashLogFile(const std::filesystem::path& path, const ReformatOptions& opt, std::string* err);

}  // namespace crashscan::scan_tool
