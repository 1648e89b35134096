#pragma once

namespace detplan::core::errors {

// Stable process-exit contract for CLI automation.
//
// The first three values keep their conventional meanings:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// The remaining values let wrappers branch on planning outcomes without
// scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kPlanSchemaInvalid = 10,
  kNotImplemented = 20,
  kReproducibilityFailed = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace detplan::core::errors
