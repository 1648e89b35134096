#pragma once

#include "planner/plan_generator.hpp"
#include "planner/plan_model.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace detplan::planner {

inline constexpr std::int64_t kDeterministicMaxLatencyMs = 8'000;

// Deterministic end-to-end planning: classify, build the goal template and
// attach the fixed constraints {max_latency_ms: 8000, must_be_reproducible:
// true}. A pure function of `request`; never fails.
Plan AssemblePlan(std::string_view request);

// IPlanGenerator adapter over AssemblePlan().
class DeterministicPlanGenerator final : public IPlanGenerator {
public:
  std::string_view Name() const override;
  bool Generate(std::string_view request, Plan& plan, std::string& error) override;
};

} // namespace detplan::planner
