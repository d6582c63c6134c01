#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "CrashLogReformat.h"
#include "TextFileUtil.h"

namespace {

using crashscan::scan_tool::ReadWholeFile;
using crashscan::scan_tool::ReformatCrashLogFile;
using crashscan::scan_tool::ReformatCrashLogLines;
using crashscan::scan_tool::ReformatOptions;

const std::vector<std::string> kLog = {
  "Buffout 4 v1.28.6",
  "PROBABLE CALL STACK:",
  "\t[ 0] 0x7FF6A1B2C3D4 Fallout4.exe+1B2C3D4",
  "\t[RSP+8 ] 0x0 (size_t) 0",
  "PLUGINS:",
  "\t[ 0]     Fallout4.esm",
  "\t[FE:  1] SomeLight.esl",
  "\t[ 2 no close bracket",
  "\tNoBrackets.esp",
};

void TestOnlyPluginSectionIsNormalized()
{
  const auto out = ReformatCrashLogLines(kLog, ReformatOptions{});
  assert(out.size() == kLog.size());
  assert(out[2] == kLog[2]);
  assert(out[3] == kLog[3]);
  assert(out[4] == "PLUGINS:");
  assert(out[5] == "\t[00]     Fallout4.esm");
  assert(out[6] == "\t[FE:001] SomeLight.esl");
  assert(out[7] == kLog[7]);
  assert(out[8] == kLog[8]);
}

void TestReformatIsIdempotent()
{
  ReformatOptions opt{};
  opt.simplify = true;
  opt.remove_substrings = { "(size_t)" };
  const auto once = ReformatCrashLogLines(kLog, opt);
  const auto twice = ReformatCrashLogLines(once, opt);
  assert(once == twice);
}

void TestSimplifyDropsExcludedLines()
{
  ReformatOptions opt{};
  opt.remove_substrings = { "(size_t)" };
  assert(ReformatCrashLogLines(kLog, opt).size() == kLog.size());

  opt.simplify = true;
  const auto out = ReformatCrashLogLines(kLog, opt);
  assert(out.size() == kLog.size() - 1);
  for (const auto& line : out) {
    assert(line.find("(size_t)") == std::string::npos);
  }
}

void TestFileRewrittenInPlace()
{
  const auto tmp = std::filesystem::temp_directory_path() / "crashscan_reformat_test.log";
  {
    std::ofstream f(tmp, std::ios::binary);
    assert(f.is_open());
    f << "PLUGINS:\r\n\t[ 1] Mod.esp\r\n";
  }

  std::string err;
  assert(ReformatCrashLogFile(tmp, ReformatOptions{}, &err));
  const auto text = ReadWholeFile(tmp, &err);
  assert(text.has_value());
  assert(*text == "PLUGINS:\n\t[01] Mod.esp\n");

  std::error_code ec;
  std::filesystem::remove(tmp, ec);
  assert(!ReformatCrashLogFile(tmp, ReformatOptions{}, &err));
  assert(!err.empty());
}

}  // namespace

int main()
{
  TestOnlyPluginSectionIsNormalized();
  TestReformatIsIdempotent();
  TestSimplifyDropsExcludedLines();
  TestFileRewrittenInPlace();
  return 0;
}
