#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace crashscan::scan_tool {

struct ConfigAuditOptions
{
  std::filesystem::path game_root;
  std::string game_name;  // "Fallout4": owner of "<game>*.ini" files and "<game>.exe" in dxvk.conf
};

// Config files under a game root keyed by lowercase file name. The first path
// (in sorted order) owns the name; later look-alikes are recorded as duplicates.
struct ConfigFileIndex
{
  std::map<std::string, std::filesystem::path> files;
  std::map<std::string, std::vector<std::filesystem::path>> duplicates;
};

bool IndexConfigFiles(const std::filesystem::path& gameRoot, ConfigFileIndex* out, std::string* err);

// Ratio in [0, 1] of matching lines (2 * common / total), over the longest common subsequence.
double LineSimilarity(const std::vector<std::string>& a, const std::vector<std::string>& b);

// Same content, same size and mtime, >= 90% line similarity, or identical INI values.
bool ConfigFilesLookDuplicate(const std::filesystem::path& a, const std::filesystem::path& b);

// "INI HOTKEY" -> "Ini Hotkey"
std::string TitleCaseWords(std::string_view s);

// Runs every config check over the game root, applying the known safe fixes in place.
// Returns false (with err) only when the game root cannot be walked.
bool AuditGameConfigFiles(const ConfigAuditOptions& opt, std::string* reportText, std::string* err);

// Report text listing required game files missing under gameRoot.
std::string CheckRequiredGameFiles(const std::filesystem::path& gameRoot, const std::vector<std::string>& requiredFiles);

}  // namespace crashscan::scan_tool
