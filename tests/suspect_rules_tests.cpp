#include <cassert>
#include <string>
#include <vector>

#include "SuspectRules.h"

namespace {

using crashscan::scan_tool::FormatSuspectLine;
using crashscan::scan_tool::ParseSubSignal;
using crashscan::scan_tool::SubSignal;
using crashscan::scan_tool::SubSignalKind;
using crashscan::scan_tool::SuspectMatch;
using crashscan::scan_tool::SuspectRules;

void TestSubSignalModifiers()
{
  SubSignal sig{};
  assert(ParseSubSignal("BSResourceNiBinaryStream", &sig));
  assert(sig.kind == SubSignalKind::kStackContains);
  assert(sig.text == "BSResourceNiBinaryStream");

  assert(ParseSubSignal("ME-REQ|tbbmalloc.dll", &sig));
  assert(sig.kind == SubSignalKind::kMainErrorRequired);
  assert(sig.text == "tbbmalloc.dll");

  assert(ParseSubSignal("ME-OPT|XAudio2_7.dll", &sig));
  assert(sig.kind == SubSignalKind::kMainErrorOptional);

  assert(ParseSubSignal("NOT|Buffout4.dll", &sig));
  assert(sig.kind == SubSignalKind::kStackExcludes);

  assert(ParseSubSignal("3|PlayerCharacter", &sig));
  assert(sig.kind == SubSignalKind::kStackMinCount);
  assert(sig.min_count == 3);
  assert(sig.text == "PlayerCharacter");

  assert(!ParseSubSignal("MAYBE|thing", &sig));
}

void TestMainErrorRules()
{
  SuspectRules rules;
  std::string err;
  assert(rules.AddMainErrorRule("5 | Memory Error", "EXCEPTION_ACCESS_VIOLATION", &err));
  assert(rules.AddMainErrorRule("6 | Stack Overflow Crash", "EXCEPTION_STACK_OVERFLOW", &err));
  assert(!rules.AddMainErrorRule("no separator", "x", &err));
  assert(!err.empty());
  assert(rules.MainErrorRuleCount() == 2);

  const auto matches = rules.MatchMainError("Unhandled exception \"EXCEPTION_ACCESS_VIOLATION\" at 0x7FF6");
  assert(matches.size() == 1);
  assert(matches[0].severity == "5");
  assert(matches[0].name == "Memory Error");
}

void TestRequiredMainErrorGatesStackRule()
{
  SuspectRules rules;
  std::string err;
  assert(rules.AddStackRule("5 | Bad INI Crash", { "ME-REQ|tbbmalloc.dll", "BSIni" }, &err));

  assert(rules.MatchStack("crash in tbbmalloc.dll+1234", "").size() == 1);
  // Stack evidence alone is not enough while a required main error item exists.
  assert(rules.MatchStack("crash in Fallout4.exe", "BSIni::Read").empty());
}

void TestOptionalAndStackSignals()
{
  SuspectRules rules;
  std::string err;
  assert(rules.AddStackRule("5 | Audio Driver Crash", { "ME-OPT|XAudio2_7.dll", "X3DAudio1_7.dll" }, &err));

  assert(rules.MatchStack("XAudio2_7.dll+ABC", "").size() == 1);
  assert(rules.MatchStack("Fallout4.exe", "X3DAudio1_7.dll+1").size() == 1);
  assert(rules.MatchStack("Fallout4.exe", "nothing").empty());
}

void TestNotSignalDisqualifies()
{
  SuspectRules rules;
  std::string err;
  assert(rules.AddStackRule("2 | Player Character Crash", { "PlayerCharacter", "NOT|hkbBehaviorGraph" }, &err));

  assert(rules.MatchStack("", "PlayerCharacter*").size() == 1);
  assert(rules.MatchStack("", "PlayerCharacter* hkbBehaviorGraph*").empty());
}

void TestMinCountSignal()
{
  SuspectRules rules;
  std::string err;
  assert(rules.AddStackRule("4 | Leveled List Crash", { "2|TESLevItem" }, &err));

  assert(rules.MatchStack("", "TESLevItem").empty());
  assert(rules.MatchStack("", "TESLevItem TESLevItem").size() == 1);
}

void TestUnknownModifierIsIgnored()
{
  SuspectRules rules;
  std::string err;
  assert(rules.AddStackRule("3 | Odd Rule", { "MAYBE|Foo" }, &err));
  assert(rules.StackRuleCount() == 1);
  assert(rules.MatchStack("MAYBE|Foo", "Foo MAYBE|Foo").empty());
}

void TestEvaluationKeepsRuleOrder()
{
  SuspectRules rules;
  std::string err;
  assert(rules.AddStackRule("4 | Zeta Crash", { "Zeta" }, &err));
  assert(rules.AddStackRule("4 | Alpha Crash", { "Alpha" }, &err));

  const auto eval = rules.Evaluate("", "Alpha Zeta");
  assert(eval.AnyFound());
  assert(eval.main_error_matches.empty());
  assert(eval.stack_matches.size() == 2);
  assert(eval.stack_matches[0].name == "Zeta Crash");
  assert(eval.stack_matches[1].name == "Alpha Crash");
  assert(!rules.Evaluate("", "").AnyFound());
}

void TestSuspectLineFormat()
{
  const std::string line = FormatSuspectLine(SuspectMatch{ "5", "Memory Error" }, 20);
  assert(line == "# Checking for Memory Error........ SUSPECT FOUND! > Severity : 5 # \n-----\n");
}

}  // namespace

int main()
{
  TestSubSignalModifiers();
  TestMainErrorRules();
  TestRequiredMainErrorGatesStackRule();
  TestOptionalAndStackSignals();
  TestNotSignalDisqualifies();
  TestMinCountSignal();
  TestUnknownModifierIsIgnored();
  TestEvaluationKeepsRuleOrder();
  TestSuspectLineFormat();
  return 0;
}
