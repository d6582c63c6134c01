#include <cassert>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "CrashLogParseCore.h"

namespace {

using namespace crashscan::scan_tool::crashlog_core;

void TestSegmentsFollowBoundaryOrder()
{
  const std::vector<std::string> lines = {
    "preamble", "A:", "  a1  ", "B:", "b1", "b2", "C:", "c1", "c2",
  };
  const std::vector<SegmentBoundary> boundaries = {
    { "A:", "B:" },
    { "B:", "C:" },
    { "C:", std::string(kEndOfFileMarker) },
  };
  const auto segments = ExtractSegments(lines, boundaries);
  assert(segments.size() == 3);
  assert(segments[0] == std::vector<std::string>{ "a1" });
  assert((segments[1] == std::vector<std::string>{ "b1", "b2" }));
  assert((segments[2] == std::vector<std::string>{ "c1", "c2" }));
}

void TestMissingEndMarkerRunsToEndOfLog()
{
  const std::vector<std::string> lines = { "A:", "a1", "a2" };
  const std::vector<SegmentBoundary> boundaries = {
    { "A:", "B:" },
    { "B:", "C:" },
  };
  const auto segments = ExtractSegments(lines, boundaries);
  assert(segments.size() == 2);
  assert((segments[0] == std::vector<std::string>{ "a1", "a2" }));
  assert(segments[1].empty());
}

void TestNoMarkersYieldsEmptySegments()
{
  const std::vector<std::string> lines = { "nothing", "here" };
  const auto segments = ExtractSegments(lines, DefaultSegmentBoundaries("f4se"));
  assert(segments.size() == static_cast<std::size_t>(CrashLogSegment::kCount));
  for (const auto& s : segments) {
    assert(s.empty());
  }
  assert(ExtractSegments(lines, {}).empty());
}

void TestDefaultBoundariesUseUppercaseXse()
{
  const auto b = DefaultSegmentBoundaries("f4se");
  assert(b.size() == 6);
  assert(b[3].end_marker == "F4SE PLUGINS:");
  assert(b[4].start_marker == "F4SE PLUGINS:");
  assert(b[5].end_marker == kEndOfFileMarker);
}

void TestMetadataFieldsAreIndependent()
{
  const std::vector<std::string> lines = {
    "Fallout 4 v1.10.163",
    "Buffout 4 v1.28.6",
    "",
    "Unhandled exception \"EXCEPTION_ACCESS_VIOLATION\" at 0x7FF6 | Fallout4.exe+1B2C3D4",
    "Fallout 4 v9.9.9",
  };
  const auto meta = ExtractCrashLogMetadata(lines, "Fallout 4", "Buffout 4");
  assert(meta.game_version == "Fallout 4 v1.10.163");
  assert(meta.crashgen_version == "Buffout 4 v1.28.6");
  assert(meta.main_error == "Unhandled exception \"EXCEPTION_ACCESS_VIOLATION\" at 0x7FF6 \n Fallout4.exe+1B2C3D4");

  const auto partial = ExtractCrashLogMetadata({ "Buffout 4 v1.26.2" }, "Fallout 4", "Buffout 4");
  assert(partial.game_version == kUnknownValue);
  assert(partial.crashgen_version == "Buffout 4 v1.26.2");
  assert(partial.main_error == kUnknownValue);
}

void TestVersionTokens()
{
  assert(ExtractVersionToken("Buffout 4 v1.28.6") == "1.28.6");
  assert(ExtractVersionToken("Fallout 4 v1.10.163") == "1.10.163");
  assert(ExtractVersionToken("Buffout 4 NG v1.35.1 Mar 20 2024") == "1.35.1");
  assert(ExtractVersionToken("UNKNOWN").empty());

  assert(CompareVersions("", "0.0.0") == 0);
  assert(CompareVersions("1.10.984", "1.10.163") > 0);
  assert(CompareVersions("1.28.6", "1.28.6.0") == 0);
  assert(IsVersionLessThan("1.26.2", "1.28.6"));
  assert(!IsVersionLessThan("1.37.0", "1.37.0"));
}

void TestModuleNames()
{
  const auto modules = ExtractModuleNames({ "Buffout4.dll v1.28.6", "  x-cell-fo4.dll   ", "", "f4ee.DLL v1.6.20" });
  assert(modules.size() == 3);
  assert(modules.count("Buffout4.dll") == 1);
  assert(modules.count("x-cell-fo4.dll") == 1);
  assert(modules.count("f4ee.DLL") == 1);
  assert(HasModuleCaseInsensitive(modules, "buffout4.dll"));
  assert(HasModuleCaseInsensitive(modules, "F4EE.dll"));
  assert(!HasModuleCaseInsensitive(modules, "achievements.dll"));
}

void TestGpuDetection()
{
  const auto unknown = DetectGpu({});
  assert(unknown.manufacturer == "Unknown");
  assert(!unknown.rival.has_value());

  const auto nvidia = DetectGpu({ "CPU: AMD Ryzen 7", "GPU #1: Nvidia GA104 [GeForce RTX 3070]" });
  assert(nvidia.manufacturer == "Nvidia");
  assert(nvidia.rival == "amd");

  const auto amd = DetectGpu({ "GPU #1: AMD Navi 21 [Radeon RX 6800]", "GPU #2: Nvidia" });
  assert(amd.manufacturer == "AMD");
  assert(amd.rival == "nvidia");
}

void TestCrashgenSettings()
{
  const auto settings = ParseCrashgenSettings({
    "[Compatibility]",
    "F4EE: true",
    "MaxStdIO: 8192",
    "Achievements: false",
    "LogName: crash",
  });
  assert(settings.size() == 4);
  assert(std::get<bool>(*FindCrashgenSetting(settings, "F4EE")));
  assert(std::get<std::int64_t>(*FindCrashgenSetting(settings, "MaxStdIO")) == 8192);
  assert(std::get<std::string>(*FindCrashgenSetting(settings, "LogName")) == "crash");
  assert(FindCrashgenSetting(settings, "Missing") == nullptr);

  assert(IsCrashgenSettingTruthy(settings, "F4EE"));
  assert(IsCrashgenSettingTruthy(settings, "MaxStdIO"));
  assert(!IsCrashgenSettingTruthy(settings, "Achievements"));
  assert(!IsCrashgenSettingTruthy(settings, "Missing"));
}

}  // namespace

int main()
{
  TestSegmentsFollowBoundaryOrder();
  TestMissingEndMarkerRunsToEndOfLog();
  TestNoMarkersYieldsEmptySegments();
  TestDefaultBoundariesUseUppercaseXse();
  TestMetadataFieldsAreIndependent();
  TestVersionTokens();
  TestModuleNames();
  TestGpuDetection();
  TestCrashgenSettings();
  return 0;
}
