#include "baselines/drift_plan_generator.hpp"

#include <array>
#include <utility>
#include <vector>

namespace detplan::baselines {

namespace {

using core::json::MakeBool;
using core::json::MakeNumber;
using core::json::MakeString;

constexpr std::uint32_t kPerturbPercent = 50;
constexpr std::array<int, 3> kTopKChoices = {3, 4, 5};
constexpr std::array<int, 3> kMaxWordsChoices = {150, 200, 250};

std::vector<planner::Step> BuildBaseSteps(std::string_view request) {
  std::vector<planner::Step> steps(3);

  steps[0].action = std::string(planner::actions::kSearch);
  steps[0].params = {
      {"source", MakeString("web")},
      {"query", MakeString(std::string(request))},
      {"top_k", MakeNumber(3)},
  };

  steps[1].action = std::string(planner::actions::kSummarize);
  steps[1].params = {
      {"style", MakeString("short")},
      {"max_words", MakeNumber(200)},
  };

  steps[2].action = std::string(planner::actions::kReflect);
  steps[2].params = {
      {"check_consistency", MakeBool(true)},
  };

  planner::RenumberSteps(steps);
  return steps;
}

// Fisher-Yates, drawing from the back: for i = n-1..1 swap(i, j), j in [0, i].
void Shuffle(std::vector<planner::Step>& steps, IRandomSource& random) {
  for (std::size_t i = steps.size(); i > 1U; --i) {
    const std::size_t j = UniformIndex(random, i);
    std::swap(steps[i - 1U], steps[j]);
  }
}

// Draws happen in current step order, one per perturbable step.
void PerturbParams(std::vector<planner::Step>& steps, IRandomSource& random) {
  for (auto& step : steps) {
    if (step.action == planner::actions::kSearch) {
      planner::SetParam(step, "top_k",
                        MakeNumber(kTopKChoices[UniformIndex(random, kTopKChoices.size())]));
    } else if (step.action == planner::actions::kSummarize) {
      planner::SetParam(
          step, "max_words",
          MakeNumber(kMaxWordsChoices[UniformIndex(random, kMaxWordsChoices.size())]));
    }
  }
}

} // namespace

DriftPlanGenerator::DriftPlanGenerator(std::unique_ptr<IRandomSource> random)
    : random_(std::move(random)) {}

std::string_view DriftPlanGenerator::Name() const {
  return "drift";
}

bool DriftPlanGenerator::Generate(std::string_view request, planner::Plan& plan,
                                  std::string& error) {
  if (random_ == nullptr) {
    error = "drift generator has no random source";
    return false;
  }

  std::vector<planner::Step> steps = BuildBaseSteps(request);
  Shuffle(steps, *random_);
  if (PercentChance(*random_, kPerturbPercent)) {
    PerturbParams(steps, *random_);
  }
  planner::RenumberSteps(steps);

  plan = planner::Plan{};
  plan.goal = std::string(kDriftGoal);
  plan.original_request = std::string(request);
  plan.steps = std::move(steps);
  plan.constraints.max_latency_ms.reset();
  plan.constraints.must_be_reproducible = false;

  error.clear();
  return true;
}

} // namespace detplan::baselines
