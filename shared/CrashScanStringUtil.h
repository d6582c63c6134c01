#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace crashscan {

inline std::string AsciiLower(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
    [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
  return out;
}

inline std::string AsciiUpper(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
    [](char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); });
  return out;
}

inline bool IsAsciiSpace(char c)
{
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

inline std::string_view TrimLeftAscii(std::string_view s)
{
  std::size_t i = 0;
  while (i < s.size() && IsAsciiSpace(s[i])) {
    i++;
  }
  return s.substr(i);
}

inline std::string_view TrimRightAscii(std::string_view s)
{
  std::size_t end = s.size();
  while (end > 0 && IsAsciiSpace(s[end - 1])) {
    end--;
  }
  return s.substr(0, end);
}

inline std::string_view TrimAscii(std::string_view s)
{
  return TrimRightAscii(TrimLeftAscii(s));
}

inline bool StartsWith(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool Contains(std::string_view haystack, std::string_view needle)
{
  return haystack.find(needle) != std::string_view::npos;
}

inline bool ContainsCaseInsensitiveAscii(std::string_view haystack, std::string_view needle)
{
  if (needle.empty()) {
    return true;
  }
  return AsciiLower(haystack).find(AsciiLower(needle)) != std::string::npos;
}

inline bool EqualsCaseInsensitiveAscii(std::string_view a, std::string_view b)
{
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); i++) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

// Number of non-overlapping occurrences.
inline std::size_t CountOccurrences(std::string_view haystack, std::string_view needle)
{
  if (needle.empty()) {
    return haystack.size() + 1;
  }
  std::size_t count = 0;
  std::size_t pos = haystack.find(needle);
  while (pos != std::string_view::npos) {
    count++;
    pos = haystack.find(needle, pos + needle.size());
  }
  return count;
}

// Splits on the first occurrence of `sep`. Returns false when `sep` is absent.
inline bool SplitOnce(std::string_view s, std::string_view sep, std::string* head, std::string* tail)
{
  const auto pos = s.find(sep);
  if (pos == std::string_view::npos) {
    return false;
  }
  if (head) {
    head->assign(s.substr(0, pos));
  }
  if (tail) {
    tail->assign(s.substr(pos + sep.size()));
  }
  return true;
}

// Splits text into lines, dropping the '\n' and a trailing '\r'.
inline std::vector<std::string> SplitLines(std::string_view text)
{
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.emplace_back(line);
    start = end + 1;
  }
  return lines;
}

inline std::string PadRight(std::string_view s, std::size_t width, char fill)
{
  std::string out(s);
  if (out.size() < width) {
    out.append(width - out.size(), fill);
  }
  return out;
}

}  // namespace crashscan
