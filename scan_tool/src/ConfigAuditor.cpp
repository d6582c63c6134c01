#include "ConfigAuditor.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "CrashScanStringUtil.h"
#include "IniDocument.h"
#include "TextFileUtil.h"

namespace crashscan::scan_tool {
namespace {

namespace fs = std::filesystem;

constexpr double kDuplicateSimilarity = 0.90;
constexpr std::size_t kMaxSimilarityLines = 4000;

bool IsConfigFileName(std::string_view lowerName)
{
  return lowerName.size() > 4 &&
         (lowerName.substr(lowerName.size() - 4) == ".ini" ||
          (lowerName.size() > 5 && lowerName.substr(lowerName.size() - 5) == ".conf"));
}

bool HasIniExtension(const fs::path& p)
{
  return AsciiLower(p.extension().string()) == ".ini";
}

// Lazily parsed documents over a ConfigFileIndex.
class ConfigFileCache
{
public:
  explicit ConfigFileCache(const ConfigFileIndex& index) : m_index(index) {}

  bool Contains(const std::string& nameLower) const { return m_index.files.count(nameLower) != 0; }
  const fs::path& PathOf(const std::string& nameLower) const { return m_index.files.at(nameLower); }

  const IniDocument* Document(const std::string& nameLower)
  {
    if (!Contains(nameLower)) {
      return nullptr;
    }
    if (auto it = m_docs.find(nameLower); it != m_docs.end()) {
      return it->second.get();
    }
    auto doc = std::make_unique<IniDocument>();
    std::string err;
    if (!doc->LoadFromFile(PathOf(nameLower), &err)) {
      spdlog::warn("CrashScan: cannot read config file {}: {}", PathOf(nameLower).string(), err);
      m_docs.emplace(nameLower, nullptr);
      return nullptr;
    }
    return m_docs.emplace(nameLower, std::move(doc)).first->second.get();
  }

  bool Set(const std::string& nameLower, std::string_view section, std::string_view key, std::string_view value)
  {
    Document(nameLower);
    auto it = m_docs.find(nameLower);
    if (it == m_docs.end() || !it->second) {
      return false;
    }
    it->second->Set(section, key, value);
    std::string err;
    if (!it->second->SaveToFile(PathOf(nameLower), &err)) {
      spdlog::error("CrashScan: cannot write config file {}: {}", PathOf(nameLower).string(), err);
      return false;
    }
    return true;
  }

private:
  const ConfigFileIndex& m_index;
  std::map<std::string, std::unique_ptr<IniDocument>> m_docs;
};

void CheckStartingConsoleCommand(ConfigFileCache* cache, const ConfigFileIndex& index, const std::string& gameLower, std::string* out)
{
  for (const auto& [nameLower, path] : index.files) {
    if (!StartsWith(nameLower, gameLower)) {
      continue;
    }
    const auto* doc = cache->Document(nameLower);
    if (!doc || !doc->Has("General", "sStartingConsoleCommand")) {
      continue;
    }
    *out += "[!] NOTICE: " + path.string() + " contains the *sStartingConsoleCommand* setting.\n";
    *out += "In rare cases, this setting can slow down the initial game startup time for some players.\n"
            "You can test your initial startup time difference by removing this setting from the INI file.\n-----\n";
  }
}

std::vector<std::string> CheckVsyncSettings(ConfigFileCache* cache, const std::string& gameName)
{
  struct VsyncSetting
  {
    std::string file;
    std::string section;
    std::string key;
  };
  const VsyncSetting settings[] = {
    { "dxvk.conf", gameName + ".exe", "dxgi.syncInterval" },
    { "enblocal.ini", "ENGINE", "ForceVSync" },
    { "longloadingtimesfix.ini", "Limiter", "EnableVSync" },
    { "reshade.ini", "APP", "ForceVsync" },
    { "fallout4_test.ini", "CreationKit", "VSyncRender" },
    { "highfpsphysicsfix.ini", "Main", "EnableVSync" },
  };

  std::vector<std::string> out;
  for (const auto& s : settings) {
    const auto* doc = cache->Document(s.file);
    if (doc && doc->GetBool(s.section, s.key).value_or(false)) {
      out.push_back(cache->PathOf(s.file).string() + " | SETTING: " + s.key + "\n");
    }
  }
  return out;
}

void ApplyFix(
  ConfigFileCache* cache,
  const std::string& file,
  std::string_view section,
  std::string_view key,
  std::string_view value,
  std::string_view description,
  std::string* out)
{
  if (!cache->Set(file, section, key, value)) {
    return;
  }
  const std::string path = cache->PathOf(file).string();
  spdlog::info("CrashScan: > > > PERFORMED {} FIX FOR {}", description, path);
  *out += "> Performed " + TitleCaseWords(description) + " Fix For : " + path + "\n";
}

void ApplyAllFixes(ConfigFileCache* cache, std::string* out)
{
  if (const auto* doc = cache->Document("espexplorer.ini")) {
    if (Contains(doc->Get("General", "HotKey").value_or(""), "; F10")) {
      ApplyFix(cache, "espexplorer.ini", "General", "HotKey", "0x79", "INI HOTKEY", out);
    }
  }
  if (const auto* doc = cache->Document("epo.ini")) {
    if (doc->GetInt("Particles", "iMaxDesired").value_or(0) > 5000) {
      ApplyFix(cache, "epo.ini", "Particles", "iMaxDesired", "5000", "INI PARTICLE COUNT", out);
    }
  }
  if (const auto* doc = cache->Document("f4ee.ini")) {
    const bool headParts = doc->GetInt("CharGen", "bUnlockHeadParts") == 0;
    const bool tints = doc->GetInt("CharGen", "bUnlockTints") == 0;
    if (headParts) {
      ApplyFix(cache, "f4ee.ini", "CharGen", "bUnlockHeadParts", "1", "INI HEAD PARTS UNLOCK", out);
    }
    if (tints) {
      ApplyFix(cache, "f4ee.ini", "CharGen", "bUnlockTints", "1", "INI FACE TINTS UNLOCK", out);
    }
  }
  if (const auto* doc = cache->Document("highfpsphysicsfix.ini")) {
    if (const auto fps = doc->GetFloat("Limiter", "LoadingScreenFPS"); fps && *fps < 600.0) {
      ApplyFix(cache, "highfpsphysicsfix.ini", "Limiter", "LoadingScreenFPS", "600.0", "INI LOADING SCREEN FPS", out);
    }
  }
}

void ReportDuplicates(const ConfigFileIndex& index, std::string* out)
{
  if (index.duplicates.empty()) {
    return;
  }
  std::vector<fs::path> all;
  for (const auto& [nameLower, paths] : index.duplicates) {
    all.push_back(index.files.at(nameLower));
    all.insert(all.end(), paths.begin(), paths.end());
  }
  std::stable_sort(all.begin(), all.end(), [](const fs::path& a, const fs::path& b) {
    return a.filename().string() < b.filename().string();
  });
  *out += "* NOTICE : DUPLICATES FOUND OF THE FOLLOWING FILES *\n";
  for (const auto& p : all) {
    *out += p.string() + "\n";
  }
}

}  // namespace

bool IndexConfigFiles(const fs::path& gameRoot, ConfigFileIndex* out, std::string* err)
{
  std::error_code ec;
  if (gameRoot.empty() || !fs::is_directory(gameRoot, ec)) {
    if (err) *err = "game root folder not found: " + gameRoot.string();
    return false;
  }

  std::vector<fs::path> candidates;
  fs::recursive_directory_iterator it(gameRoot, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    if (err) *err = "cannot walk " + gameRoot.string() + ": " + ec.message();
    return false;
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code fileEc;
    if (!it->is_regular_file(fileEc)) {
      continue;
    }
    if (IsConfigFileName(AsciiLower(it->path().filename().string()))) {
      candidates.push_back(it->path());
    }
  }
  std::sort(candidates.begin(), candidates.end());

  ConfigFileIndex index{};
  for (const auto& path : candidates) {
    const std::string nameLower = AsciiLower(path.filename().string());
    const auto existing = index.files.find(nameLower);
    if (existing == index.files.end()) {
      index.files.emplace(nameLower, path);
      continue;
    }
    if (ConfigFilesLookDuplicate(existing->second, path)) {
      index.duplicates[nameLower].push_back(path);
    }
  }
  *out = std::move(index);
  return true;
}

double LineSimilarity(const std::vector<std::string>& a, const std::vector<std::string>& b)
{
  const std::size_t total = a.size() + b.size();
  if (total == 0) {
    return 1.0;
  }
  std::vector<std::size_t> prev(b.size() + 1, 0);
  std::vector<std::size_t> cur(b.size() + 1, 0);
  for (std::size_t i = 1; i <= a.size(); i++) {
    for (std::size_t j = 1; j <= b.size(); j++) {
      cur[j] = (a[i - 1] == b[j - 1]) ? prev[j - 1] + 1 : std::max(prev[j], cur[j - 1]);
    }
    std::swap(prev, cur);
  }
  return (2.0 * static_cast<double>(prev[b.size()])) / static_cast<double>(total);
}

bool ConfigFilesLookDuplicate(const fs::path& a, const fs::path& b)
{
  const auto textA = ReadWholeFile(a, nullptr);
  const auto textB = ReadWholeFile(b, nullptr);
  if (!textA || !textB) {
    return false;
  }
  if (*textA == *textB) {
    return true;
  }

  std::error_code ec1;
  std::error_code ec2;
  const auto sizeA = fs::file_size(a, ec1);
  const auto sizeB = fs::file_size(b, ec2);
  if (!ec1 && !ec2 && sizeA == sizeB) {
    const auto timeA = fs::last_write_time(a, ec1);
    const auto timeB = fs::last_write_time(b, ec2);
    if (!ec1 && !ec2 && timeA == timeB) {
      return true;
    }
  }

  const auto linesA = SplitLines(*textA);
  const auto linesB = SplitLines(*textB);
  if (linesA.size() <= kMaxSimilarityLines && linesB.size() <= kMaxSimilarityLines &&
      LineSimilarity(linesA, linesB) >= kDuplicateSimilarity) {
    return true;
  }

  if (HasIniExtension(a) && HasIniExtension(b)) {
    IniDocument docA;
    IniDocument docB;
    docA.LoadFromText(*textA);
    docB.LoadFromText(*textB);
    return docA.Values() == docB.Values();
  }
  return false;
}

std::string TitleCaseWords(std::string_view s)
{
  std::string out(s);
  bool startOfWord = true;
  for (auto& c : out) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc)) {
      c = static_cast<char>(startOfWord ? std::toupper(uc) : std::tolower(uc));
      startOfWord = false;
    } else {
      startOfWord = true;
    }
  }
  return out;
}

bool AuditGameConfigFiles(const ConfigAuditOptions& opt, std::string* reportText, std::string* err)
{
  ConfigFileIndex index{};
  if (!IndexConfigFiles(opt.game_root, &index, err)) {
    return false;
  }
  spdlog::info("CrashScan: config audit found {} config files ({} with duplicates) under {}",
               index.files.size(), index.duplicates.size(), opt.game_root.string());

  ConfigFileCache cache(index);
  std::string out;
  CheckStartingConsoleCommand(&cache, index, AsciiLower(opt.game_name), &out);
  const auto vsync = CheckVsyncSettings(&cache, opt.game_name);
  ApplyAllFixes(&cache, &out);
  if (!vsync.empty()) {
    out += "* NOTICE : VSYNC IS CURRENTLY ENABLED IN THE FOLLOWING FILES *\n";
    for (const auto& line : vsync) {
      out += line;
    }
  }
  ReportDuplicates(index, &out);

  *reportText = std::move(out);
  return true;
}

std::string CheckRequiredGameFiles(const fs::path& gameRoot, const std::vector<std::string>& requiredFiles)
{
  std::error_code ec;
  if (gameRoot.empty() || !fs::is_directory(gameRoot, ec)) {
    return "❌ Game root folder is not set or missing, skipping main files check... \n-----\n";
  }
  std::string out;
  for (const auto& rel : requiredFiles) {
    if (!fs::exists(gameRoot / fs::path(rel), ec)) {
      out += "# ❌ CAUTION : REQUIRED GAME FILE IS MISSING : " + rel + " # \n-----\n";
    }
  }
  if (out.empty()) {
    out = "✔️ All required game files are present in your game folder! \n-----\n";
  }
  return out;
}

}  // namespace crashscan::scan_tool
