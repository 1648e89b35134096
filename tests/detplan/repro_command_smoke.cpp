#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"

#include <iostream>
#include <string>

namespace {

using detplan::tests::common::AssertContains;
using detplan::tests::common::AssertEqual;
using detplan::tests::common::AssertExitCode;
using detplan::tests::common::DispatchCaptured;

void AssertSeededRunReports() {
  const auto output = DispatchCaptured({"detplan", "repro", "--trials", "12", "--seed", "7"});
  AssertExitCode(output.exit_code, 0, "seeded repro");
  AssertContains(output.stdout_text, "Testing with request:\n  Find 3 recent papers");
  AssertContains(output.stdout_text, "Number of trials: 12");
  AssertContains(output.stdout_text, "=== Results ===");
  AssertContains(output.stdout_text, "Deterministic planner: 1 unique plan(s) over 12 runs.");
  AssertContains(output.stdout_text, "Baseline planner (drift): ");
  AssertContains(output.stdout_text,
                 "✅ Deterministic planner is fully reproducible for this input.");
  AssertContains(output.stdout_text,
                 "✅ Baseline planner shows non-deterministic behavior (as expected).");
  AssertContains(output.stderr_text, "seed=\"7\"");

  const auto replay = DispatchCaptured({"detplan", "repro", "--trials", "12", "--seed", "7"});
  AssertEqual(replay.stdout_text, output.stdout_text, "same seed replays the same report");
}

void AssertParallelWorkers() {
  const auto output = DispatchCaptured({"detplan", "repro", "--goal", "Today's news", "--trials",
                                        "20", "--workers", "3", "--seed", "11"});
  AssertExitCode(output.exit_code, 0, "parallel repro");
  AssertContains(output.stdout_text, "Testing with request:\n  Today's news\n");
  AssertContains(output.stdout_text, "Deterministic planner: 1 unique plan(s) over 20 runs.");
}

void AssertRemoteBaselineNotImplemented() {
  const auto output =
      DispatchCaptured({"detplan", "repro", "--trials", "3", "--baseline", "remote"});
  AssertExitCode(output.exit_code, 20, "remote baseline");
  AssertContains(output.stderr_text, "not implemented");
  AssertContains(output.stderr_text, "remote generator failed on trial 1");
}

void AssertUsageErrors() {
  AssertExitCode(DispatchCaptured({"detplan", "repro", "--trials", "0"}).exit_code, 2,
                 "zero trials");
  AssertExitCode(DispatchCaptured({"detplan", "repro", "--trials", "abc"}).exit_code, 2,
                 "non-numeric trials");
  AssertExitCode(DispatchCaptured({"detplan", "repro", "--workers", "0"}).exit_code, 2,
                 "zero workers");
  AssertExitCode(DispatchCaptured({"detplan", "repro", "--seed", "-1"}).exit_code, 2,
                 "negative seed");
  AssertExitCode(DispatchCaptured({"detplan", "repro", "--baseline", "oracle"}).exit_code, 2,
                 "unknown baseline");
  AssertExitCode(DispatchCaptured({"detplan", "repro", "--trials"}).exit_code, 2,
                 "missing trials value");
  AssertExitCode(DispatchCaptured({"detplan", "repro", "extra"}).exit_code, 2,
                 "positional argument");
  AssertExitCode(DispatchCaptured({"detplan", "repro", "--trials", "--seed", "7"}).exit_code, 2,
                 "flag in value position");
}

} // namespace

int main() {
  AssertSeededRunReports();
  AssertParallelWorkers();
  AssertRemoteBaselineNotImplemented();
  AssertUsageErrors();

  std::cout << "repro_command_smoke: ok\n";
  return 0;
}
