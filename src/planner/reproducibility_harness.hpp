#pragma once

#include "planner/plan_generator.hpp"
#include "planner/plan_model.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace detplan::planner {

struct TrialResult {
  // Number of distinct canonical forms across all trials.
  std::size_t distinct_count = 0;
  // Every generated plan, in trial order.
  std::vector<Plan> plans;
};

// Runs `trials` independent Generate() calls for `request` and counts distinct
// canonical plans.
//
// Contract:
// - `trials` must be >= 1, otherwise returns false.
// - A generator failure stops the loop and is returned as-is through `error`
//   (prefixed with the generator name and trial number). No retries.
// - On success `result.plans.size() == trials`.
bool RunTrials(IPlanGenerator& generator, std::string_view request, std::size_t trials,
               TrialResult& result, std::string& error);

// Builds the generator a worker thread will own. Invoked on the calling
// thread, once per worker, before any worker starts.
using PlanGeneratorFactory =
    std::function<std::unique_ptr<IPlanGenerator>(std::size_t worker_index)>;

// Parallel variant of RunTrials().
//
// Trial i runs on worker (i % workers) using that worker's own generator, so
// no random source is ever shared between threads. Plans are stored by trial
// index, which keeps `result.plans` in trial order. `workers` is clamped to
// `trials`; `workers == 1` behaves like RunTrials(). Any worker failure fails
// the whole run with the lowest failing trial's error.
bool RunTrialsParallel(const PlanGeneratorFactory& factory, std::string_view request,
                       std::size_t trials, std::size_t workers, TrialResult& result,
                       std::string& error);

} // namespace detplan::planner
