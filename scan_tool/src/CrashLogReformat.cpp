#include "CrashLogReformat.h"

#include <algorithm>
#include <sstream>

#include "CrashScanStringUtil.h"
#include "TextFileUtil.h"

namespace crashscan::scan_tool {
namespace {

bool ShouldRemove(std::string_view line, const ReformatOptions& opt)
{
  if (!opt.simplify) {
    return false;
  }
  for (const auto& s : opt.remove_substrings) {
    if (!s.empty() && Contains(line, s)) {
      return true;
    }
  }
  return false;
}

std::string NormalizeLoadOrderBrackets(const std::string& line)
{
  const auto open = line.find('[');
  if (open == std::string::npos) {
    return line;
  }
  const auto close = line.find(']', open + 1);
  if (close == std::string::npos) {
    return line;
  }
  std::string out = line;
  std::replace(out.begin() + static_cast<std::ptrdiff_t>(open) + 1, out.begin() + static_cast<std::ptrdiff_t>(close), ' ', '0');
  return out;
}

}  // namespace

std::vector<std::string> ReformatCrashLogLines(const std::vector<std::string>& lines, const ReformatOptions& opt)
{
  std::vector<std::string> reversedOut;
  reversedOut.reserve(lines.size());

  // Walk bottom-up: everything below (and including) the "PLUGINS:" header is the plugin list.
  bool inPlugins = true;
  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    const std::string& line = *it;
    if (inPlugins && StartsWith(line, "PLUGINS:")) {
      inPlugins = false;
    }
    if (ShouldRemove(line, opt)) {
      continue;
    }
    if (inPlugins && line.find('[') != std::string::npos) {
      reversedOut.push_back(NormalizeLoadOrderBrackets(line));
    } else {
      reversedOut.push_back(line);
    }
  }

  std::reverse(reversedOut.begin(), reversedOut.end());
  return reversedOut;
}

bool ReformatCrashLogFile(const std::filesystem::path& path, const ReformatOptions& opt, std::string* err)
{
  const auto text = ReadWholeFile(path, err);
  if (!text) {
    return false;
  }

  const auto lines = ReformatCrashLogLines(SplitLines(*text), opt);
  std::ostringstream oss;
  for (const auto& line : lines) {
    oss << line << '\n';
  }
  return WriteWholeFile(path, oss.str(), err);
}

}  // namespace crashscan::scan_tool
