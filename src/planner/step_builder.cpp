#include "planner/step_builder.hpp"

#include <string>
#include <utility>

namespace detplan::planner {

namespace {

using core::json::MakeBool;
using core::json::MakeNumber;
using core::json::MakeString;
using core::json::MakeStringArray;

void AppendStep(std::vector<Step>& steps, std::string_view action, StepParams params) {
  Step step;
  step.id = static_cast<std::uint32_t>(steps.size() + 1U);
  step.action = std::string(action);
  step.params = std::move(params);
  steps.push_back(std::move(step));
}

std::vector<Step> BuildFindPapersAndSummarizeSteps(std::string_view request) {
  std::vector<Step> steps;
  AppendStep(steps, actions::kSearch,
             {
                 {"source", MakeString("scholar_like")},
                 {"query", MakeString(std::string(request))},
                 {"top_k", MakeNumber(3)},
             });
  AppendStep(steps, actions::kExtract,
             {
                 {"fields", MakeStringArray({"title", "year", "abstract"})},
             });
  AppendStep(steps, actions::kSummarize,
             {
                 {"style", MakeString("concise")},
                 {"max_words", MakeNumber(300)},
             });
  return steps;
}

std::vector<Step> BuildFindPapersSteps(std::string_view request) {
  std::vector<Step> steps;
  AppendStep(steps, actions::kSearch,
             {
                 {"source", MakeString("scholar_like")},
                 {"query", MakeString(std::string(request))},
                 {"top_k", MakeNumber(5)},
             });
  return steps;
}

// Entities come from the request itself, so no step carries the query text.
std::vector<Step> BuildCompareSourcesSteps() {
  std::vector<Step> steps;
  AppendStep(steps, actions::kIdentifyEntities,
             {
                 {"from_request", MakeBool(true)},
                 {"max_entities", MakeNumber(4)},
             });
  AppendStep(steps, actions::kFetchFacts,
             {
                 {"per_entity_top_k", MakeNumber(3)},
             });
  AppendStep(steps, actions::kCompare,
             {
                 {"dimensions", MakeStringArray({"pros", "cons", "risks"})},
             });
  return steps;
}

std::vector<Step> BuildGenerateReportSteps(std::string_view request) {
  std::vector<Step> steps;
  AppendStep(steps, actions::kGatherContext,
             {
                 {"source", MakeString("mixed")},
                 {"query", MakeString(std::string(request))},
             });
  AppendStep(steps, actions::kOutline,
             {
                 {"sections", MakeStringArray({"introduction", "body", "conclusion"})},
             });
  AppendStep(steps, actions::kWrite,
             {
                 {"format", MakeString("markdown")},
                 {"target_audience", MakeString("general")},
             });
  return steps;
}

std::vector<Step> BuildFetchNewsSteps(std::string_view request) {
  std::vector<Step> steps;
  AppendStep(steps, actions::kSearch,
             {
                 {"source", MakeString("news_api")},
                 {"query", MakeString(std::string(request))},
                 {"top_k", MakeNumber(5)},
             });
  AppendStep(steps, actions::kSummarize,
             {
                 {"style", MakeString("bullet_points")},
                 {"max_items", MakeNumber(5)},
             });
  return steps;
}

std::vector<Step> BuildGenericInformationSteps(std::string_view request) {
  std::vector<Step> steps;
  AppendStep(steps, actions::kSearch,
             {
                 {"source", MakeString("web")},
                 {"query", MakeString(std::string(request))},
                 {"top_k", MakeNumber(3)},
             });
  AppendStep(steps, actions::kSummarize,
             {
                 {"style", MakeString("short")},
                 {"max_words", MakeNumber(200)},
             });
  return steps;
}

} // namespace

std::vector<Step> BuildSteps(GoalTag goal, std::string_view request) {
  switch (goal) {
  case GoalTag::kFindPapersAndSummarize:
    return BuildFindPapersAndSummarizeSteps(request);
  case GoalTag::kFindPapers:
    return BuildFindPapersSteps(request);
  case GoalTag::kCompareSources:
    return BuildCompareSourcesSteps();
  case GoalTag::kGenerateReport:
    return BuildGenerateReportSteps(request);
  case GoalTag::kFetchNews:
    return BuildFetchNewsSteps(request);
  case GoalTag::kGenericInformationTask:
    return BuildGenericInformationSteps(request);
  }

  return BuildGenericInformationSteps(request);
}

} // namespace detplan::planner
