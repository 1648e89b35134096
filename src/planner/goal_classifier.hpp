#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace detplan::planner {

enum class GoalTag {
  kFindPapersAndSummarize,
  kFindPapers,
  kCompareSources,
  kGenerateReport,
  kFetchNews,
  kGenericInformationTask,
};

// Wire name used in plan JSON, e.g. "find_papers_and_summarize".
std::string_view ToString(GoalTag goal);

// Inverse of ToString(). Returns false for names outside the closed set.
bool ParseGoalTag(std::string_view name, GoalTag& goal);

// One classification rule over the case-folded request.
//
// A rule matches when at least one `any_of` keyword is present (or `any_of`
// is empty) and every `all_of` keyword is present.
struct GoalRule {
  std::string_view id;
  std::vector<std::string_view> any_of;
  std::vector<std::string_view> all_of;
  GoalTag goal = GoalTag::kGenericInformationTask;
};

// Ordered rule table. Several rules can match the same text; only the first
// match counts, so the order is part of the contract:
//   1. paper|journal|research + summar -> find_papers_and_summarize
//   2. paper|journal|research          -> find_papers
//   3. compare|vs                      -> compare_sources
//   4. report + generate               -> generate_report
//   5. news                            -> fetch_news
// No match falls back to generic_information_task.
const std::vector<GoalRule>& GoalRules();

// ASCII lower-casing used for matching only; the request itself is never
// rewritten.
std::string FoldCase(std::string_view text);

// `folded_request` must already be case-folded.
bool RuleMatches(const GoalRule& rule, std::string_view folded_request);

// Pure and total: every input, including "", maps to exactly one tag.
GoalTag ClassifyGoal(std::string_view request);

} // namespace detplan::planner
