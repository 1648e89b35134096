#include "planner/repro_report.hpp"

namespace detplan::planner {

bool DeterministicPathReproducible(const ReproReport& report) {
  return report.deterministic_distinct == 1U;
}

bool BaselineShowsDrift(const ReproReport& report) {
  return report.baseline_distinct > 1U;
}

void WriteReproReport(const ReproReport& report, std::ostream& out) {
  out << "Testing with request:\n"
      << "  " << report.request << "\n\n"
      << "Number of trials: " << report.trials << "\n\n";

  out << "=== Results ===\n"
      << "Deterministic planner: " << report.deterministic_distinct
      << " unique plan(s) over " << report.trials << " runs.\n"
      << "Baseline planner (" << report.baseline_name << "): " << report.baseline_distinct
      << " unique plan(s) over " << report.trials << " runs.\n\n";

  if (DeterministicPathReproducible(report)) {
    out << "✅ Deterministic planner is fully reproducible for this input.\n";
  } else {
    out << "⚠️ Deterministic planner produced more than one unique plan (unexpected).\n";
  }

  if (BaselineShowsDrift(report)) {
    out << "✅ Baseline planner shows non-deterministic behavior (as expected).\n";
  } else {
    out << "⚠️ Baseline planner appears deterministic in this sample (could be luck).\n";
  }
}

} // namespace detplan::planner
