#include <cassert>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <vector>

#include "PluginLoadOrder.h"

namespace {

using crashscan::scan_tool::AddModulePlugins;
using crashscan::scan_tool::FindPlugin;
using crashscan::scan_tool::LoadOrderVersionContext;
using crashscan::scan_tool::ParseLoadOrderText;
using crashscan::scan_tool::PluginList;
using crashscan::scan_tool::ReadLoadOrderFile;
using crashscan::scan_tool::RemoveIgnoredPlugins;
using crashscan::scan_tool::ScanPluginSegment;

LoadOrderVersionContext OriginalGame()
{
  LoadOrderVersionContext ctx{};
  ctx.game_version = "1.10.163";
  ctx.crashgen_version = "1.28.6";
  ctx.game_version_original = "1.10.163";
  ctx.game_version_vr = "1.2.72";
  ctx.game_version_new = "1.10.984";
  return ctx;
}

void TestPluginSegmentOrigins()
{
  const auto scan = ScanPluginSegment({
    "[00]     Fallout4.esm",
    "[2A]     TacticalReload.esm",
    "[FE:001] SomeLight.esl",
    "[2A]     TacticalReload.esm",
    "Buffout4.dll",
    "NoSlot.esp",
    "garbage without extension",
  }, OriginalGame());

  assert(scan.plugins.size() == 5);
  assert(scan.plugins[0].name == "Fallout4.esm");
  assert(scan.plugins[0].origin == "00");
  assert(FindPlugin(scan.plugins, "TacticalReload.esm")->origin == "2A");
  assert(FindPlugin(scan.plugins, "SomeLight.esl")->origin == "FE001");
  assert(FindPlugin(scan.plugins, "Buffout4.dll")->origin == "DLL");
  assert(FindPlugin(scan.plugins, "NoSlot.esp")->origin == "???");
  assert(!scan.plugin_limit_triggered);
  assert(!scan.limit_check_disabled);
}

void TestPluginLimitMarker()
{
  const std::vector<std::string> segment = { "[00] Fallout4.esm", "[FF] Overflow.esp" };

  const auto original = ScanPluginSegment(segment, OriginalGame());
  assert(original.plugin_limit_triggered);
  assert(!original.limit_check_disabled);

  LoadOrderVersionContext ng = OriginalGame();
  ng.game_version = "1.10.984";
  ng.crashgen_version = "1.30.0";
  const auto oldCrashgen = ScanPluginSegment(segment, ng);
  assert(!oldCrashgen.plugin_limit_triggered);
  assert(oldCrashgen.limit_check_disabled);

  ng.crashgen_version = "1.37.0";
  const auto fixedCrashgen = ScanPluginSegment(segment, ng);
  assert(!fixedCrashgen.plugin_limit_triggered);
  assert(!fixedCrashgen.limit_check_disabled);
}

void TestModulePluginsAndIgnoreList()
{
  PluginList plugins = ScanPluginSegment({ "[00] Fallout4.esm", "[01] Buffout4.dll.esp" }, OriginalGame()).plugins;
  const std::set<std::string> xse = { "Buffout4.dll", "f4ee.dll" };
  AddModulePlugins(&plugins, xse, { "vulkan-1.dll v1.3.2", "d3d11.dll" });

  assert(FindPlugin(plugins, "Buffout4.dll") == nullptr);
  assert(FindPlugin(plugins, "f4ee.dll")->origin == "DLL");
  assert(FindPlugin(plugins, "vulkan-1.dll")->origin == "DLL");
  assert(FindPlugin(plugins, "d3d11.dll") == nullptr);

  RemoveIgnoredPlugins(&plugins, { "F4EE.DLL", "fallout4.esm" });
  assert(FindPlugin(plugins, "f4ee.dll") == nullptr);
  assert(FindPlugin(plugins, "Fallout4.esm") == nullptr);
  assert(FindPlugin(plugins, "vulkan-1.dll") != nullptr);
}

void TestLoadOrderFile()
{
  const auto lo = ParseLoadOrderText("# header line\nFallout4.esm\n\nMod.esp\r\nMod.esp\n");
  assert(lo.size() == 2);
  assert(lo[1].name == "Mod.esp");
  assert(lo[1].origin == "LO");

  const auto tmp = std::filesystem::temp_directory_path() / "crashscan_loadorder_test.txt";
  {
    std::ofstream f(tmp);
    assert(f.is_open());
    f << "*loadorder*\nFallout4.esm\nTacticalReload.esm\n";
  }
  const auto fromFile = ReadLoadOrderFile(tmp);
  assert(fromFile.plugins_loaded);
  assert(fromFile.plugins.size() == 2);
  assert(fromFile.report_lines.size() == 3);

  std::error_code ec;
  std::filesystem::remove(tmp, ec);
  const auto missing = ReadLoadOrderFile(tmp);
  assert(!missing.plugins_loaded);
  assert(missing.report_lines.size() == 4);
}

}  // namespace

int main()
{
  TestPluginSegmentOrigins();
  TestPluginLimitMarker();
  TestModulePluginsAndIgnoreList();
  TestLoadOrderFile();
  return 0;
}
