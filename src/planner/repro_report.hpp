#pragma once

#include <cstddef>
#include <ostream>
#include <string>

namespace detplan::planner {

// Inputs for the human-readable reproducibility comparison. Not a
// machine-parseable format.
struct ReproReport {
  std::string request;
  std::size_t trials = 0;
  std::size_t deterministic_distinct = 0;
  std::string baseline_name;
  std::size_t baseline_distinct = 0;
};

// The deterministic path is correct only with exactly one distinct plan.
bool DeterministicPathReproducible(const ReproReport& report);

// Probabilistic expectation: the baseline should drift over enough trials.
// A miss is reported as a warning, never as a failure.
bool BaselineShowsDrift(const ReproReport& report);

void WriteReproReport(const ReproReport& report, std::ostream& out);

} // namespace detplan::planner
