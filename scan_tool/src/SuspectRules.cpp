#include "SuspectRules.h"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "CrashScanStringUtil.h"

namespace crashscan::scan_tool {
namespace {

bool SplitRuleKey(std::string_view key, std::string* severity, std::string* name)
{
  return SplitOnce(key, " | ", severity, name);
}

bool IsDecimal(std::string_view s)
{
  return !s.empty() && s.size() < 10 &&
         std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

// Returns true when a NOT signal matched and the rule is disqualified.
bool ApplySubSignal(const SubSignal& sig, std::string_view mainError, std::string_view callStack, SuspectMatchStatus* status)
{
  switch (sig.kind) {
    case SubSignalKind::kStackContains:
      if (Contains(callStack, sig.text)) {
        status->stack_found = true;
      }
      return false;
    case SubSignalKind::kMainErrorRequired:
      status->has_required_item = true;
      if (Contains(mainError, sig.text)) {
        status->error_req_found = true;
      }
      return false;
    case SubSignalKind::kMainErrorOptional:
      if (Contains(mainError, sig.text)) {
        status->error_opt_found = true;
      }
      return false;
    case SubSignalKind::kStackExcludes:
      return Contains(callStack, sig.text);
    case SubSignalKind::kStackMinCount:
      if (CountOccurrences(callStack, sig.text) >= sig.min_count) {
        status->stack_found = true;
      }
      return false;
  }
  return false;
}

bool IsSuspectMatch(const SuspectMatchStatus& status)
{
  if (status.has_required_item) {
    return status.error_req_found;
  }
  return status.error_opt_found || status.stack_found;
}

}  // namespace

bool ParseSubSignal(std::string_view raw, SubSignal* out)
{
  if (!out) {
    return false;
  }
  SubSignal sig{};
  std::string modifier;
  std::string text;
  if (!SplitOnce(raw, "|", &modifier, &text)) {
    sig.kind = SubSignalKind::kStackContains;
    sig.text = std::string(raw);
  } else if (modifier == "ME-REQ") {
    sig.kind = SubSignalKind::kMainErrorRequired;
    sig.text = std::move(text);
  } else if (modifier == "ME-OPT") {
    sig.kind = SubSignalKind::kMainErrorOptional;
    sig.text = std::move(text);
  } else if (modifier == "NOT") {
    sig.kind = SubSignalKind::kStackExcludes;
    sig.text = std::move(text);
  } else if (IsDecimal(modifier)) {
    sig.kind = SubSignalKind::kStackMinCount;
    sig.min_count = static_cast<std::size_t>(std::stoul(modifier));
    sig.text = std::move(text);
  } else {
    return false;
  }
  *out = std::move(sig);
  return true;
}

bool SuspectRules::AddMainErrorRule(std::string_view key, std::string_view signal, std::string* err)
{
  MainErrorRule rule{};
  if (!SplitRuleKey(key, &rule.severity, &rule.name)) {
    if (err) *err = "suspect key without \" | \": " + std::string(key);
    return false;
  }
  if (signal.empty()) {
    if (err) *err = "empty main error signal for: " + std::string(key);
    return false;
  }
  rule.signal = std::string(signal);
  m_mainErrorRules.push_back(std::move(rule));
  return true;
}

bool SuspectRules::AddStackRule(std::string_view key, const std::vector<std::string>& signals, std::string* err)
{
  StackRule rule{};
  if (!SplitRuleKey(key, &rule.severity, &rule.name)) {
    if (err) *err = "suspect key without \" | \": " + std::string(key);
    return false;
  }
  rule.signals.reserve(signals.size());
  for (const auto& raw : signals) {
    SubSignal sig{};
    if (!ParseSubSignal(raw, &sig)) {
      // Unknown modifiers never influence the decision.
      spdlog::warn("CrashScan: ignoring signal with unknown modifier in '{}': {}", key, raw);
      continue;
    }
    rule.signals.push_back(std::move(sig));
  }
  m_stackRules.push_back(std::move(rule));
  return true;
}

std::vector<SuspectMatch> SuspectRules::MatchMainError(std::string_view mainError) const
{
  std::vector<SuspectMatch> out;
  for (const auto& rule : m_mainErrorRules) {
    if (Contains(mainError, rule.signal)) {
      out.push_back(SuspectMatch{ rule.severity, rule.name });
    }
  }
  return out;
}

std::vector<SuspectMatch> SuspectRules::MatchStack(std::string_view mainError, std::string_view callStack) const
{
  std::vector<SuspectMatch> out;
  for (const auto& rule : m_stackRules) {
    SuspectMatchStatus status{};
    bool excluded = false;
    for (const auto& sig : rule.signals) {
      if (ApplySubSignal(sig, mainError, callStack, &status)) {
        excluded = true;
        break;
      }
    }
    if (!excluded && IsSuspectMatch(status)) {
      out.push_back(SuspectMatch{ rule.severity, rule.name });
    }
  }
  return out;
}

SuspectEvaluation SuspectRules::Evaluate(std::string_view mainError, std::string_view callStack) const
{
  SuspectEvaluation out{};
  out.main_error_matches = MatchMainError(mainError);
  out.stack_matches = MatchStack(mainError, callStack);
  return out;
}

std::size_t SuspectRules::MainErrorRuleCount() const
{
  return m_mainErrorRules.size();
}

std::size_t SuspectRules::StackRuleCount() const
{
  return m_stackRules.size();
}

std::string FormatSuspectLine(const SuspectMatch& match, std::size_t nameWidth)
{
  return "# Checking for " + PadRight(match.name, nameWidth, '.') + " SUSPECT FOUND! > Severity : " + match.severity +
         " # \n-----\n";
}

}  // namespace crashscan::scan_tool
