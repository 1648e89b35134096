#pragma once

#include "planner/plan_model.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace detplan::planner {

enum class JsonStyle {
  kCompact,
  kPretty,
};

// Plan document in schema field order:
//   goal, original_request, steps[id, action, params], constraints
// Parameters keep insertion order. `kPretty` uses a 2-space indent.
std::string ToJson(const Plan& plan, JsonStyle style = JsonStyle::kCompact);

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct PlanValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// Parses plan JSON text and validates it against the plan schema.
//
// Contract:
// - `report.valid` is true only when `plan` was fully populated.
// - Parse errors become one issue at path `$`.
// - Schema issues use JSON-path style locations, e.g. `$.steps[1].id`.
void ParsePlanJson(std::string_view json_text, Plan& plan, PlanValidationReport& report);

// Loads and validates a plan file.
//
// Contract:
// - Returns false if file I/O fails and sets `error`.
// - Otherwise returns true and populates `report` (and `plan` when valid).
bool LoadPlanFile(const std::filesystem::path& path, Plan& plan, PlanValidationReport& report,
                  std::string& error);

} // namespace detplan::planner
