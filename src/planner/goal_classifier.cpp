#include "planner/goal_classifier.hpp"

#include <algorithm>
#include <cctype>

namespace detplan::planner {

namespace {

constexpr GoalTag kFallbackGoal = GoalTag::kGenericInformationTask;

bool Contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

} // namespace

std::string_view ToString(GoalTag goal) {
  switch (goal) {
  case GoalTag::kFindPapersAndSummarize:
    return "find_papers_and_summarize";
  case GoalTag::kFindPapers:
    return "find_papers";
  case GoalTag::kCompareSources:
    return "compare_sources";
  case GoalTag::kGenerateReport:
    return "generate_report";
  case GoalTag::kFetchNews:
    return "fetch_news";
  case GoalTag::kGenericInformationTask:
    return "generic_information_task";
  }

  return "generic_information_task";
}

bool ParseGoalTag(std::string_view name, GoalTag& goal) {
  static constexpr GoalTag kAllGoals[] = {
      GoalTag::kFindPapersAndSummarize,
      GoalTag::kFindPapers,
      GoalTag::kCompareSources,
      GoalTag::kGenerateReport,
      GoalTag::kFetchNews,
      GoalTag::kGenericInformationTask,
  };

  for (const GoalTag candidate : kAllGoals) {
    if (ToString(candidate) == name) {
      goal = candidate;
      return true;
    }
  }
  return false;
}

const std::vector<GoalRule>& GoalRules() {
  static const std::vector<GoalRule> kRules = {
      {
          .id = "literature_with_summary",
          .any_of = {"paper", "journal", "research"},
          .all_of = {"summar"},
          .goal = GoalTag::kFindPapersAndSummarize,
      },
      {
          .id = "literature",
          .any_of = {"paper", "journal", "research"},
          .all_of = {},
          .goal = GoalTag::kFindPapers,
      },
      {
          .id = "comparison",
          .any_of = {"compare", "vs"},
          .all_of = {},
          .goal = GoalTag::kCompareSources,
      },
      {
          .id = "report",
          .any_of = {},
          .all_of = {"report", "generate"},
          .goal = GoalTag::kGenerateReport,
      },
      {
          .id = "news",
          .any_of = {"news"},
          .all_of = {},
          .goal = GoalTag::kFetchNews,
      },
  };
  return kRules;
}

std::string FoldCase(std::string_view text) {
  std::string folded(text);
  std::transform(folded.begin(), folded.end(), folded.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return folded;
}

bool RuleMatches(const GoalRule& rule, std::string_view folded_request) {
  const bool any_present =
      rule.any_of.empty() ||
      std::any_of(rule.any_of.begin(), rule.any_of.end(), [&](std::string_view keyword) {
        return Contains(folded_request, keyword);
      });
  if (!any_present) {
    return false;
  }

  return std::all_of(rule.all_of.begin(), rule.all_of.end(), [&](std::string_view keyword) {
    return Contains(folded_request, keyword);
  });
}

GoalTag ClassifyGoal(std::string_view request) {
  const std::string folded = FoldCase(request);
  for (const auto& rule : GoalRules()) {
    if (RuleMatches(rule, folded)) {
      return rule.goal;
    }
  }
  return kFallbackGoal;
}

} // namespace detplan::planner
