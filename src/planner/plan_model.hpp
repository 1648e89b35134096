#pragma once

#include "core/json_dom.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace detplan::planner {

// Action vocabulary. The deterministic templates only use the first nine;
// `reflect` appears in the drift baseline.
namespace actions {
inline constexpr std::string_view kSearch = "search";
inline constexpr std::string_view kExtract = "extract";
inline constexpr std::string_view kSummarize = "summarize";
inline constexpr std::string_view kIdentifyEntities = "identify_entities";
inline constexpr std::string_view kFetchFacts = "fetch_facts";
inline constexpr std::string_view kCompare = "compare";
inline constexpr std::string_view kGatherContext = "gather_context";
inline constexpr std::string_view kOutline = "outline";
inline constexpr std::string_view kWrite = "write";
inline constexpr std::string_view kReflect = "reflect";
} // namespace actions

// One named step parameter. Values are JSON scalars or small lists.
struct StepParam {
  std::string name;
  core::json::Value value;
};

// Parameters keep insertion order for human-facing output. Equality between
// plans never depends on this order; see Canonicalize().
using StepParams = std::vector<StepParam>;

struct Step {
  std::uint32_t id = 0;
  std::string action;
  StepParams params;
};

struct PlanConstraints {
  // Unset serializes as JSON null (no latency budget).
  std::optional<std::int64_t> max_latency_ms;
  bool must_be_reproducible = false;
};

// A plan is built once per planning call and treated as a value afterwards.
struct Plan {
  std::string goal;
  std::string original_request;
  std::vector<Step> steps;
  PlanConstraints constraints;
};

// Returns the parameter value or nullptr when `name` is absent.
const core::json::Value* FindParam(const Step& step, std::string_view name);

// Replaces an existing parameter in place or appends a new one, so a step
// never carries two parameters with the same name.
void SetParam(Step& step, std::string_view name, core::json::Value value);

// Rewrites ids to 1..steps.size() in current order.
void RenumberSteps(std::vector<Step>& steps);

// True when steps[i].id == i + 1 for every index.
bool HasContiguousStepIds(const std::vector<Step>& steps);

} // namespace detplan::planner
