#include "planner/reproducibility_harness.hpp"

#include "planner/canonicalizer.hpp"

#include <algorithm>
#include <atomic>
#include <optional>
#include <set>
#include <thread>
#include <utility>

namespace detplan::planner {

namespace {

std::string FormatTrialError(std::string_view generator_name, std::size_t trial_index,
                             std::string_view cause) {
  return std::string(generator_name) + " generator failed on trial " +
         std::to_string(trial_index + 1U) + ": " + std::string(cause);
}

std::size_t CountDistinct(const std::vector<Plan>& plans) {
  std::set<std::string> seen;
  for (const auto& plan : plans) {
    seen.insert(Canonicalize(plan));
  }
  return seen.size();
}

struct TrialFailure {
  std::size_t trial_index = 0;
  std::string message;
};

} // namespace

bool RunTrials(IPlanGenerator& generator, std::string_view request, std::size_t trials,
               TrialResult& result, std::string& error) {
  result = TrialResult{};
  error.clear();

  if (trials == 0U) {
    error = "trial count must be at least 1";
    return false;
  }

  std::set<std::string> seen;
  result.plans.reserve(trials);
  for (std::size_t i = 0; i < trials; ++i) {
    Plan plan;
    std::string generate_error;
    if (!generator.Generate(request, plan, generate_error)) {
      error = FormatTrialError(generator.Name(), i, generate_error);
      return false;
    }
    seen.insert(Canonicalize(plan));
    result.plans.push_back(std::move(plan));
  }

  result.distinct_count = seen.size();
  return true;
}

bool RunTrialsParallel(const PlanGeneratorFactory& factory, std::string_view request,
                       std::size_t trials, std::size_t workers, TrialResult& result,
                       std::string& error) {
  result = TrialResult{};
  error.clear();

  if (trials == 0U) {
    error = "trial count must be at least 1";
    return false;
  }
  if (workers == 0U) {
    error = "worker count must be at least 1";
    return false;
  }
  if (!factory) {
    error = "plan generator factory is empty";
    return false;
  }
  workers = std::min(workers, trials);

  std::vector<std::unique_ptr<IPlanGenerator>> generators;
  generators.reserve(workers);
  for (std::size_t w = 0; w < workers; ++w) {
    std::unique_ptr<IPlanGenerator> generator = factory(w);
    if (generator == nullptr) {
      error = "plan generator factory returned no generator for worker " + std::to_string(w);
      return false;
    }
    generators.push_back(std::move(generator));
  }

  if (workers == 1U) {
    return RunTrials(*generators.front(), request, trials, result, error);
  }

  std::vector<Plan> plans(trials);
  std::vector<std::optional<TrialFailure>> failures(workers);
  std::atomic<bool> stop_requested{false};

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t w = 0; w < workers; ++w) {
    threads.emplace_back([&, w]() {
      IPlanGenerator& generator = *generators[w];
      for (std::size_t i = w; i < trials; i += workers) {
        if (stop_requested.load(std::memory_order_relaxed)) {
          return;
        }
        std::string generate_error;
        if (!generator.Generate(request, plans[i], generate_error)) {
          failures[w] = TrialFailure{.trial_index = i,
                                     .message = FormatTrialError(generator.Name(), i,
                                                                 generate_error)};
          stop_requested.store(true, std::memory_order_relaxed);
          return;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  const TrialFailure* first_failure = nullptr;
  for (const auto& failure : failures) {
    if (failure.has_value() &&
        (first_failure == nullptr || failure->trial_index < first_failure->trial_index)) {
      first_failure = &*failure;
    }
  }
  if (first_failure != nullptr) {
    error = first_failure->message;
    return false;
  }

  result.distinct_count = CountDistinct(plans);
  result.plans = std::move(plans);
  return true;
}

} // namespace detplan::planner
