#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace crashscan::scan_tool {

// Ordered report fragments of one crash log, concatenated once at the end.
class ReportBuffer
{
public:
  void Append(std::string fragment) { m_fragments.push_back(std::move(fragment)); }

  void Extend(std::initializer_list<std::string_view> fragments)
  {
    for (const auto f : fragments) {
      m_fragments.emplace_back(f);
    }
  }

  void Extend(const std::vector<std::string>& fragments)
  {
    m_fragments.insert(m_fragments.end(), fragments.begin(), fragments.end());
  }

  const std::vector<std::string>& Fragments() const { return m_fragments; }
  bool Empty() const { return m_fragments.empty(); }

  std::string Join() const
  {
    std::size_t total = 0;
    for (const auto& f : m_fragments) {
      total += f.size();
    }
    std::string out;
    out.reserve(total);
    for (const auto& f : m_fragments) {
      out += f;
    }
    return out;
  }

private:
  std::vector<std::string> m_fragments;
};

}  // namespace crashscan::scan_tool
