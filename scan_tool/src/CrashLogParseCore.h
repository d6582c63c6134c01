#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "CrashScanStringUtil.h"

namespace crashscan::scan_tool {
namespace crashlog_core {

inline constexpr std::string_view kUnknownValue = "UNKNOWN";
inline constexpr std::string_view kEndOfFileMarker = "EOF";

struct SegmentBoundary
{
  std::string start_marker;
  std::string end_marker;  // kEndOfFileMarker = rest of the log
};

enum class SegmentScanState
{
  kSeeking,
  kCollecting,
  kDone,
};

struct SegmentTransition
{
  SegmentScanState next = SegmentScanState::kSeeking;
  bool open_segment = false;
  bool close_segment = false;
  bool consume_line = true;
};

// Transition table of the segment scanner. Only the boundary pair at the
// cursor is ever consulted, so overlapping markers resolve in list order.
inline SegmentTransition NextSegmentTransition(SegmentScanState state, const SegmentBoundary& boundary, std::string_view line)
{
  SegmentTransition t{};
  t.next = state;
  switch (state) {
    case SegmentScanState::kSeeking:
      if (StartsWith(line, boundary.start_marker)) {
        t.open_segment = true;
        t.next = (boundary.end_marker == kEndOfFileMarker) ? SegmentScanState::kDone : SegmentScanState::kCollecting;
      }
      break;
    case SegmentScanState::kCollecting:
      if (StartsWith(line, boundary.end_marker)) {
        // The closing line is re-examined as the next pair's start marker.
        t.close_segment = true;
        t.consume_line = false;
        t.next = SegmentScanState::kSeeking;
      }
      break;
    case SegmentScanState::kDone:
      t.consume_line = false;
      break;
  }
  return t;
}

// Always returns exactly boundaries.size() segments; unmatched ones are empty.
inline std::vector<std::vector<std::string>> ExtractSegments(
  const std::vector<std::string>& lines,
  const std::vector<SegmentBoundary>& boundaries)
{
  std::vector<std::vector<std::string>> segments;
  segments.reserve(boundaries.size());

  const std::size_t n = lines.size();
  SegmentScanState state = boundaries.empty() ? SegmentScanState::kDone : SegmentScanState::kSeeking;
  std::size_t pair = 0;
  std::size_t start = 0;
  std::size_t i = 0;

  auto takeRange = [&](std::size_t from, std::size_t to) {
    std::vector<std::string> seg;
    for (std::size_t k = from; k < to; k++) {
      seg.emplace_back(TrimAscii(lines[k]));
    }
    return seg;
  };

  while (state != SegmentScanState::kDone && i < n) {
    const SegmentTransition t = NextSegmentTransition(state, boundaries[pair], lines[i]);
    if (t.open_segment) {
      start = i + 1;
      if (t.next == SegmentScanState::kDone) {
        segments.push_back(takeRange(start, n));
      }
    }
    if (t.close_segment) {
      segments.push_back(takeRange(start, i));
      pair++;
    }
    state = t.next;
    if (state == SegmentScanState::kSeeking && pair >= boundaries.size()) {
      state = SegmentScanState::kDone;
    }
    if (t.consume_line) {
      i++;
    }
  }

  if (state == SegmentScanState::kCollecting) {
    segments.push_back(takeRange(start, n));
  }

  while (segments.size() < boundaries.size()) {
    segments.emplace_back();
  }
  return segments;
}

enum class CrashLogSegment : std::size_t
{
  kCrashgen = 0,
  kSystem = 1,
  kCallStack = 2,
  kAllModules = 3,
  kXseModules = 4,
  kPlugins = 5,
  kCount = 6,
};

inline std::vector<SegmentBoundary> DefaultSegmentBoundaries(std::string_view xseAcronym)
{
  std::string xse = std::string(xseAcronym);
  for (auto& c : xse) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return {
    { "\t[Compatibility]", "SYSTEM SPECS:" },
    { "SYSTEM SPECS:", "PROBABLE CALL STACK:" },
    { "PROBABLE CALL STACK:", "MODULES:" },
    { "MODULES:", xse + " PLUGINS:" },
    { xse + " PLUGINS:", "PLUGINS:" },
    { "PLUGINS:", std::string(kEndOfFileMarker) },
  };
}

struct CrashLogMetadata
{
  std::string game_version{ kUnknownValue };
  std::string crashgen_version{ kUnknownValue };
  std::string main_error{ kUnknownValue };
};

inline CrashLogMetadata ExtractCrashLogMetadata(
  const std::vector<std::string>& lines,
  std::string_view gameRootName,
  std::string_view crashgenName)
{
  CrashLogMetadata out{};
  bool gotGame = false;
  bool gotCrashgen = false;
  bool gotError = false;

  for (const auto& line : lines) {
    if (gotGame && gotCrashgen && gotError) {
      break;
    }
    if (!gotGame && !gameRootName.empty() && StartsWith(line, gameRootName)) {
      out.game_version = std::string(TrimAscii(line));
      gotGame = true;
    }
    if (!gotCrashgen && !crashgenName.empty() && StartsWith(line, crashgenName)) {
      out.crashgen_version = std::string(TrimAscii(line));
      gotCrashgen = true;
    }
    if (!gotError && StartsWith(line, "Unhandled exception")) {
      std::string err = line;
      if (const auto bar = err.find('|'); bar != std::string::npos) {
        err[bar] = '\n';
      }
      out.main_error = std::move(err);
      gotError = true;
    }
  }
  return out;
}

// "Buffout 4 v1.28.6" -> "1.28.6". The last 'v'-prefixed token wins; empty when none.
inline std::string ExtractVersionToken(std::string_view line)
{
  std::string version;
  std::size_t i = 0;
  const std::string_view s = TrimAscii(line);
  while (i < s.size()) {
    while (i < s.size() && IsAsciiSpace(s[i])) {
      i++;
    }
    const std::size_t start = i;
    while (i < s.size() && !IsAsciiSpace(s[i])) {
      i++;
    }
    const std::string_view token = s.substr(start, i - start);
    if (token.size() > 1 && token[0] == 'v') {
      version.assign(token.substr(1));
    }
  }
  return version;
}

inline std::vector<int> ParseVersionSegments(std::string_view s)
{
  std::vector<int> out;
  std::size_t i = 0;
  while (i < s.size()) {
    const std::size_t start = i;
    while (i < s.size() && s[i] != '.') {
      ++i;
    }
    const std::string_view token = s.substr(start, i - start);
    int value = 0;
    bool hasDigit = false;
    for (const char c : token) {
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        break;
      }
      hasDigit = true;
      value = (value * 10) + (c - '0');
    }
    out.push_back(hasDigit ? value : 0);
    if (i < s.size() && s[i] == '.') {
      ++i;
    }
  }
  return out;
}

// Missing segments compare as zero, so "" == "0.0.0".
inline int CompareVersions(std::string_view lhs, std::string_view rhs)
{
  const auto lv = ParseVersionSegments(lhs);
  const auto rv = ParseVersionSegments(rhs);
  const std::size_t n = std::max(lv.size(), rv.size());
  for (std::size_t i = 0; i < n; ++i) {
    const int a = (i < lv.size()) ? lv[i] : 0;
    const int b = (i < rv.size()) ? rv[i] : 0;
    if (a != b) {
      return a < b ? -1 : 1;
    }
  }
  return 0;
}

inline bool IsVersionLessThan(std::string_view lhs, std::string_view rhs)
{
  return CompareVersions(lhs, rhs) < 0;
}

// "f4ee.dll v1.6.20" -> "f4ee.dll"
inline std::set<std::string> ExtractModuleNames(const std::vector<std::string>& moduleLines)
{
  std::set<std::string> out;
  for (const auto& raw : moduleLines) {
    const std::string text(TrimAscii(raw));
    if (text.empty()) {
      continue;
    }
    const auto pos = AsciiLower(text).find(".dll");
    if (pos != std::string::npos) {
      out.insert(text.substr(0, pos + 4));
    } else {
      out.insert(text);
    }
  }
  return out;
}

inline bool HasModuleCaseInsensitive(const std::set<std::string>& modules, std::string_view name)
{
  for (const auto& m : modules) {
    if (EqualsCaseInsensitiveAscii(m, name)) {
      return true;
    }
  }
  return false;
}

struct GpuInfo
{
  std::string manufacturer = "Unknown";
  std::optional<std::string> rival;  // "nvidia" / "amd"
};

inline GpuInfo DetectGpu(const std::vector<std::string>& systemSegment)
{
  GpuInfo out{};
  for (const auto& line : systemSegment) {
    if (Contains(line, "GPU #1") && Contains(line, "AMD")) {
      out.manufacturer = "AMD";
      out.rival = "nvidia";
      return out;
    }
  }
  for (const auto& line : systemSegment) {
    if (Contains(line, "GPU #1") && Contains(line, "Nvidia")) {
      out.manufacturer = "Nvidia";
      out.rival = "amd";
      return out;
    }
  }
  return out;
}

using CrashgenSettingValue = std::variant<bool, std::int64_t, std::string>;

// Crash generator settings in log order.
using CrashgenSettings = std::vector<std::pair<std::string, CrashgenSettingValue>>;

inline CrashgenSettings ParseCrashgenSettings(const std::vector<std::string>& crashgenSegment)
{
  CrashgenSettings out;
  for (const auto& line : crashgenSegment) {
    std::string key;
    std::string rawValue;
    if (!SplitOnce(line, ":", &key, &rawValue)) {
      continue;
    }
    const std::string value(TrimAscii(rawValue));
    if (value == "true") {
      out.emplace_back(std::move(key), true);
    } else if (value == "false") {
      out.emplace_back(std::move(key), false);
    } else if (!value.empty() && value.size() < 19 &&
               std::all_of(value.begin(), value.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
      out.emplace_back(std::move(key), static_cast<std::int64_t>(std::stoll(value)));
    } else {
      out.emplace_back(std::move(key), value);
    }
  }
  return out;
}

inline const CrashgenSettingValue* FindCrashgenSetting(const CrashgenSettings& settings, std::string_view key)
{
  for (const auto& [k, v] : settings) {
    if (k == key) {
      return &v;
    }
  }
  return nullptr;
}

// Truthiness of a setting the way the report logic reads it: missing, false, 0 and "" are false.
inline bool IsCrashgenSettingTruthy(const CrashgenSettings& settings, std::string_view key)
{
  const auto* v = FindCrashgenSetting(settings, key);
  if (!v) {
    return false;
  }
  if (const auto* b = std::get_if<bool>(v)) {
    return *b;
  }
  if (const auto* i = std::get_if<std::int64_t>(v)) {
    return *i != 0;
  }
  return !std::get<std::string>(*v).empty();
}

}  // namespace crashlog_core

using crashlog_core::CompareVersions;
using crashlog_core::ExtractCrashLogMetadata;
using crashlog_core::ExtractSegments;
using crashlog_core::ExtractVersionToken;
using crashlog_core::IsVersionLessThan;

}  // namespace crashscan::scan_tool
