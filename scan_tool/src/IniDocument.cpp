#include "IniDocument.h"

#include <cstdlib>

#include "CrashScanStringUtil.h"
#include "TextFileUtil.h"

namespace crashscan::scan_tool {
namespace {

constexpr std::size_t kNoLine = static_cast<std::size_t>(-1);

std::string UnquoteValue(std::string_view v)
{
  if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
    return std::string(v.substr(1, v.size() - 2));
  }
  return std::string(v);
}

// " # comment" after an unquoted value is dropped; ';' stays part of the value.
std::string_view StripInlineComment(std::string_view v)
{
  if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
    return v;
  }
  for (std::size_t i = 1; i < v.size(); i++) {
    if (v[i] == '#' && IsAsciiSpace(v[i - 1])) {
      return TrimRightAscii(v.substr(0, i));
    }
  }
  return v;
}

}  // namespace

bool IniDocument::LoadFromFile(const std::filesystem::path& path, std::string* err)
{
  const auto text = ReadWholeFile(path, err);
  if (!text) {
    return false;
  }
  LoadFromText(*text);
  return true;
}

void IniDocument::LoadFromText(std::string_view text)
{
  // UTF-8 BOM
  if (StartsWith(text, "\xEF\xBB\xBF")) {
    text.remove_prefix(3);
  }
  m_lines = SplitLines(text);
  Reindex();
}

void IniDocument::Reindex()
{
  m_sections.clear();
  m_sections.push_back(Section{ "", "", kNoLine, {} });

  for (std::size_t i = 0; i < m_lines.size(); i++) {
    const std::string_view line = TrimAscii(m_lines[i]);
    if (line.empty() || line.front() == ';' || line.front() == '#') {
      continue;
    }
    if (line.front() == '[') {
      const auto close = line.find(']');
      if (close != std::string_view::npos) {
        const std::string name(TrimAscii(line.substr(1, close - 1)));
        m_sections.push_back(Section{ name, AsciiLower(name), i, {} });
        continue;
      }
    }

    const auto delim = m_lines[i].find_first_of("=:");
    if (delim == std::string::npos) {
      continue;
    }
    const std::string_view raw = m_lines[i];
    const std::string_view key = TrimAscii(raw.substr(0, delim));
    if (key.empty()) {
      continue;
    }
    std::size_t valueOffset = delim + 1;
    while (valueOffset < raw.size() && (raw[valueOffset] == ' ' || raw[valueOffset] == '\t')) {
      valueOffset++;
    }
    const std::string_view value = StripInlineComment(TrimAscii(raw.substr(valueOffset)));
    m_sections.back().entries.push_back(Entry{ AsciiLower(key), UnquoteValue(value), i, valueOffset });
  }
}

const IniDocument::Section* IniDocument::FindSection(std::string_view section) const
{
  const std::string lower = AsciiLower(section);
  for (const auto& s : m_sections) {
    if (s.name_lower == lower) {
      return &s;
    }
  }
  return nullptr;
}

const IniDocument::Entry* IniDocument::FindEntry(std::string_view section, std::string_view key) const
{
  const std::string lower = AsciiLower(key);
  const std::string sectionLower = AsciiLower(section);
  // Repeated section headers merge, first key wins.
  for (const auto& s : m_sections) {
    if (s.name_lower != sectionLower) {
      continue;
    }
    for (const auto& e : s.entries) {
      if (e.key_lower == lower) {
        return &e;
      }
    }
  }
  return nullptr;
}

bool IniDocument::HasSection(std::string_view section) const
{
  const auto* s = FindSection(section);
  return s && (s->header_line != kNoLine || !s->entries.empty());
}

bool IniDocument::Has(std::string_view section, std::string_view key) const
{
  return FindEntry(section, key) != nullptr;
}

std::optional<std::string> IniDocument::Get(std::string_view section, std::string_view key) const
{
  if (const auto* e = FindEntry(section, key)) {
    return e->value;
  }
  return std::nullopt;
}

std::optional<bool> IniDocument::GetBool(std::string_view section, std::string_view key) const
{
  const auto v = Get(section, key);
  if (!v) {
    return std::nullopt;
  }
  const std::string lower = AsciiLower(*v);
  if (lower == "1" || lower == "yes" || lower == "true" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "no" || lower == "false" || lower == "off") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::int64_t> IniDocument::GetInt(std::string_view section, std::string_view key) const
{
  const auto v = Get(section, key);
  if (!v || v->empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  const long long parsed = std::strtoll(v->c_str(), &end, 10);
  if (end != v->c_str() + v->size()) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(parsed);
}

std::optional<double> IniDocument::GetFloat(std::string_view section, std::string_view key) const
{
  const auto v = Get(section, key);
  if (!v || v->empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  const double parsed = std::strtod(v->c_str(), &end);
  if (end != v->c_str() + v->size()) {
    return std::nullopt;
  }
  return parsed;
}

void IniDocument::Set(std::string_view section, std::string_view key, std::string_view value)
{
  if (const auto* e = FindEntry(section, key)) {
    std::string& line = m_lines[e->line];
    line = line.substr(0, e->value_offset) + std::string(value);
    Reindex();
    return;
  }

  const std::string entryLine = std::string(key) + " = " + std::string(value);
  const std::string sectionLower = AsciiLower(section);
  const Section* target = nullptr;
  for (const auto& s : m_sections) {
    if (s.name_lower == sectionLower && (s.header_line != kNoLine || sectionLower.empty())) {
      target = &s;
    }
  }

  if (target) {
    std::size_t insertAt = target->entries.empty()
      ? (target->header_line == kNoLine ? 0 : target->header_line + 1)
      : target->entries.back().line + 1;
    m_lines.insert(m_lines.begin() + static_cast<std::ptrdiff_t>(insertAt), entryLine);
  } else {
    if (!m_lines.empty() && !TrimAscii(m_lines.back()).empty()) {
      m_lines.emplace_back();
    }
    m_lines.push_back("[" + std::string(section) + "]");
    m_lines.push_back(entryLine);
  }
  Reindex();
}

std::map<std::string, std::map<std::string, std::string>> IniDocument::Values() const
{
  std::map<std::string, std::map<std::string, std::string>> out;
  for (const auto& s : m_sections) {
    if (s.header_line == kNoLine && s.entries.empty()) {
      continue;
    }
    auto& dst = out[s.name_lower];
    for (const auto& e : s.entries) {
      dst.emplace(e.key_lower, e.value);
    }
  }
  return out;
}

std::string IniDocument::ToText() const
{
  std::string out;
  for (const auto& line : m_lines) {
    out += line;
    out += '\n';
  }
  return out;
}

bool IniDocument::SaveToFile(const std::filesystem::path& path, std::string* err) const
{
  return WriteWholeFile(path, ToText(), err);
}

}  // namespace crashscan::scan_tool
