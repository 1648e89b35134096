#include "baselines/drift_plan_generator.hpp"
#include "baselines/random_source.hpp"
#include "common/assertions.hpp"
#include "planner/canonicalizer.hpp"
#include "planner/plan_assembler.hpp"
#include "planner/reproducibility_harness.hpp"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using detplan::tests::common::AssertContains;
using detplan::tests::common::Fail;

// Succeeds until `fail_on_call`, then reports a failure.
class FailingGenerator final : public detplan::planner::IPlanGenerator {
public:
  explicit FailingGenerator(std::size_t fail_on_call) : fail_on_call_(fail_on_call) {}

  std::string_view Name() const override {
    return "failing";
  }

  bool Generate(std::string_view request, detplan::planner::Plan& plan,
                std::string& error) override {
    ++calls_;
    if (calls_ == fail_on_call_) {
      error = "backend unavailable";
      return false;
    }
    plan = detplan::planner::AssemblePlan(request);
    return true;
  }

  std::size_t Calls() const {
    return calls_;
  }

private:
  std::size_t fail_on_call_ = 0;
  std::size_t calls_ = 0;
};

// Alternates between two goals so exactly two canonical forms appear.
class AlternatingGenerator final : public detplan::planner::IPlanGenerator {
public:
  std::string_view Name() const override {
    return "alternating";
  }

  bool Generate(std::string_view, detplan::planner::Plan& plan, std::string&) override {
    plan = detplan::planner::AssemblePlan((calls_++ % 2U) == 0U ? "Today's news" : "Hello there");
    return true;
  }

private:
  std::size_t calls_ = 0;
};

std::vector<std::string> CanonicalForms(const detplan::planner::TrialResult& result) {
  std::vector<std::string> forms;
  for (const auto& plan : result.plans) {
    forms.push_back(detplan::planner::Canonicalize(plan));
  }
  return forms;
}

detplan::planner::PlanGeneratorFactory SeededDriftFactory(std::uint64_t seed) {
  return [seed](std::size_t worker) -> std::unique_ptr<detplan::planner::IPlanGenerator> {
    return std::make_unique<detplan::baselines::DriftPlanGenerator>(
        std::make_unique<detplan::baselines::SplitMixRandomSource>(
            detplan::baselines::DeriveWorkerSeed(seed, worker)));
  };
}

void AssertDeterministicTrials() {
  const std::string request =
      "Find 3 recent papers on deterministic AI agents and summarize the key patterns.";
  for (const std::size_t trials : {1U, 5U, 50U}) {
    detplan::planner::DeterministicPlanGenerator generator;
    detplan::planner::TrialResult result;
    std::string error;
    if (!detplan::planner::RunTrials(generator, request, trials, result, error)) {
      Fail("deterministic trials failed: " + error);
    }
    if (result.distinct_count != 1U) {
      Fail("deterministic generator produced more than one canonical plan");
    }
    if (result.plans.size() != trials) {
      Fail("trial result does not hold one plan per trial");
    }
    for (const auto& plan : result.plans) {
      if (!detplan::planner::HasContiguousStepIds(plan.steps)) {
        Fail("deterministic plan has non-contiguous step ids");
      }
    }
  }
}

void AssertZeroTrialsRejected() {
  detplan::planner::DeterministicPlanGenerator generator;
  detplan::planner::TrialResult result;
  std::string error;
  if (detplan::planner::RunTrials(generator, "x", 0, result, error)) {
    Fail("zero trials should be rejected");
  }
  AssertContains(error, "at least 1");
}

void AssertFailurePropagates() {
  FailingGenerator generator(3);
  detplan::planner::TrialResult result;
  std::string error;
  if (detplan::planner::RunTrials(generator, "Hello there", 10, result, error)) {
    Fail("generator failure should fail the harness");
  }
  AssertContains(error, "failing generator failed on trial 3");
  AssertContains(error, "backend unavailable");
  if (generator.Calls() != 3U) {
    Fail("harness should stop at the first failing trial");
  }
}

void AssertDistinctCounting() {
  AlternatingGenerator generator;
  detplan::planner::TrialResult result;
  std::string error;
  if (!detplan::planner::RunTrials(generator, "ignored", 6, result, error)) {
    Fail("alternating trials failed: " + error);
  }
  if (result.distinct_count != 2U) {
    Fail("expected exactly two distinct canonical plans");
  }
}

void AssertParallelDeterministic() {
  const detplan::planner::PlanGeneratorFactory factory =
      [](std::size_t) -> std::unique_ptr<detplan::planner::IPlanGenerator> {
    return std::make_unique<detplan::planner::DeterministicPlanGenerator>();
  };
  detplan::planner::TrialResult result;
  std::string error;
  if (!detplan::planner::RunTrialsParallel(factory, "Today's news", 25, 4, result, error)) {
    Fail("parallel deterministic trials failed: " + error);
  }
  if (result.distinct_count != 1U || result.plans.size() != 25U) {
    Fail("parallel deterministic trials should yield 25 plans with one canonical form");
  }
}

void AssertParallelDriftIsSeedStable() {
  std::string error;
  detplan::planner::TrialResult first;
  detplan::planner::TrialResult second;
  if (!detplan::planner::RunTrialsParallel(SeededDriftFactory(7), "Hello there", 40, 3, first,
                                           error) ||
      !detplan::planner::RunTrialsParallel(SeededDriftFactory(7), "Hello there", 40, 3, second,
                                           error)) {
    Fail("parallel drift trials failed: " + error);
  }
  if (first.distinct_count <= 1U) {
    Fail("drift baseline should produce more than one canonical plan over 40 trials");
  }
  if (CanonicalForms(first) != CanonicalForms(second)) {
    Fail("same seed and worker count should replay the same per-trial plans");
  }
  for (const auto& plan : first.plans) {
    if (plan.constraints.must_be_reproducible || plan.constraints.max_latency_ms.has_value()) {
      Fail("drift plans must not claim reproducibility or a latency budget");
    }
    if (!detplan::planner::HasContiguousStepIds(plan.steps)) {
      Fail("drift plan has non-contiguous step ids");
    }
  }
}

void AssertParallelWorkerFailure() {
  // Worker 2 owns trials 3, 7, 11, ... and fails on its second one.
  const detplan::planner::PlanGeneratorFactory factory =
      [](std::size_t worker) -> std::unique_ptr<detplan::planner::IPlanGenerator> {
    return std::make_unique<FailingGenerator>(worker == 2U ? 2U : 0U);
  };
  for (int round = 0; round < 20; ++round) {
    detplan::planner::TrialResult result;
    std::string error;
    if (detplan::planner::RunTrialsParallel(factory, "Hello there", 40, 4, result, error)) {
      Fail("a failing worker should fail the parallel run");
    }
    AssertContains(error, "failing generator failed on trial 7: backend unavailable");
    if (result.distinct_count != 0U || !result.plans.empty()) {
      Fail("failed parallel run must not report plans");
    }
  }
}

void AssertParallelFactoryFailure() {
  const detplan::planner::PlanGeneratorFactory factory =
      [](std::size_t) -> std::unique_ptr<detplan::planner::IPlanGenerator> { return nullptr; };
  detplan::planner::TrialResult result;
  std::string error;
  if (detplan::planner::RunTrialsParallel(factory, "x", 4, 2, result, error)) {
    Fail("null generator from factory should fail the run");
  }
  if (error.empty()) {
    Fail("factory failure should set an error");
  }
}

} // namespace

int main() {
  AssertDeterministicTrials();
  AssertZeroTrialsRejected();
  AssertFailurePropagates();
  AssertDistinctCounting();
  AssertParallelDeterministic();
  AssertParallelDriftIsSeedStable();
  AssertParallelWorkerFailure();
  AssertParallelFactoryFailure();

  std::cout << "reproducibility_harness_smoke: ok\n";
  return 0;
}
