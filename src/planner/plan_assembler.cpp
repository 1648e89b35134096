#include "planner/plan_assembler.hpp"

#include "planner/goal_classifier.hpp"
#include "planner/step_builder.hpp"

namespace detplan::planner {

Plan AssemblePlan(std::string_view request) {
  const GoalTag goal = ClassifyGoal(request);

  Plan plan;
  plan.goal = std::string(ToString(goal));
  plan.original_request = std::string(request);
  plan.steps = BuildSteps(goal, request);
  plan.constraints.max_latency_ms = kDeterministicMaxLatencyMs;
  plan.constraints.must_be_reproducible = true;
  return plan;
}

std::string_view DeterministicPlanGenerator::Name() const {
  return "deterministic";
}

bool DeterministicPlanGenerator::Generate(std::string_view request, Plan& plan,
                                          std::string& error) {
  error.clear();
  plan = AssemblePlan(request);
  return true;
}

} // namespace detplan::planner
