#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace crashscan::scan_tool {

enum class SubSignalKind
{
  kStackContains,      // bare text
  kMainErrorRequired,  // ME-REQ|text
  kMainErrorOptional,  // ME-OPT|text
  kStackExcludes,      // NOT|text
  kStackMinCount,      // N|text
};

struct SubSignal
{
  SubSignalKind kind = SubSignalKind::kStackContains;
  std::string text;
  std::size_t min_count = 0;  // kStackMinCount only
};

// Parsed once at load time. Text without '|' is a bare stack signal; an unknown modifier fails.
bool ParseSubSignal(std::string_view raw, SubSignal* out);

struct SuspectMatchStatus
{
  bool has_required_item = false;
  bool error_req_found = false;
  bool error_opt_found = false;
  bool stack_found = false;
};

struct SuspectMatch
{
  std::string severity;
  std::string name;
};

struct SuspectEvaluation
{
  std::vector<SuspectMatch> main_error_matches;
  std::vector<SuspectMatch> stack_matches;

  bool AnyFound() const { return !main_error_matches.empty() || !stack_matches.empty(); }
};

// "<severity> | <name>" rules in dataset order. Report order is rule order.
class SuspectRules
{
public:
  bool AddMainErrorRule(std::string_view key, std::string_view signal, std::string* err);
  bool AddStackRule(std::string_view key, const std::vector<std::string>& signals, std::string* err);

  std::vector<SuspectMatch> MatchMainError(std::string_view mainError) const;
  std::vector<SuspectMatch> MatchStack(std::string_view mainError, std::string_view callStack) const;
  SuspectEvaluation Evaluate(std::string_view mainError, std::string_view callStack) const;

  std::size_t MainErrorRuleCount() const;
  std::size_t StackRuleCount() const;

private:
  struct MainErrorRule
  {
    std::string severity;
    std::string name;
    std::string signal;
  };
  struct StackRule
  {
    std::string severity;
    std::string name;
    std::vector<SubSignal> signals;
  };
  std::vector<MainErrorRule> m_mainErrorRules;
  std::vector<StackRule> m_stackRules;
};

// "# Checking for <name....> SUSPECT FOUND! > Severity : <sev> # \n-----\n"
std::string FormatSuspectLine(const SuspectMatch& match, std::size_t nameWidth);

}  // namespace crashscan::scan_tool
