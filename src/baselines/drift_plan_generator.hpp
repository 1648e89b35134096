#pragma once

#include "baselines/random_source.hpp"
#include "planner/plan_generator.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace detplan::baselines {

inline constexpr std::string_view kDriftGoal = "mock_dynamic_plan";

// Non-deterministic baseline that stands in for an unpredictable planning
// agent.
//
// Each call starts from search -> summarize -> reflect, shuffles the steps,
// and half of the time re-draws search.top_k from {3,4,5} and
// summarize.max_words from {150,200,250}. Ids are renumbered after the
// shuffle, so drift shows up in action order and parameters only. Plans carry
// no latency budget and `must_be_reproducible == false`.
//
// With a scripted IRandomSource the output is exact, which is how tests pin
// the wiring independently of real randomness.
class DriftPlanGenerator final : public planner::IPlanGenerator {
public:
  explicit DriftPlanGenerator(std::unique_ptr<IRandomSource> random);

  std::string_view Name() const override;
  bool Generate(std::string_view request, planner::Plan& plan, std::string& error) override;

private:
  std::unique_ptr<IRandomSource> random_;
};

} // namespace detplan::baselines
