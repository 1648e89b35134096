#include "baselines/drift_plan_generator.hpp"
#include "baselines/random_source.hpp"
#include "common/assertions.hpp"
#include "planner/canonicalizer.hpp"
#include "planner/plan_json.hpp"
#include "planner/reproducibility_harness.hpp"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

using detplan::tests::common::AssertContains;
using detplan::tests::common::AssertEqual;
using detplan::tests::common::Fail;

// Replays a fixed list of draws, cycling when exhausted, and counts them.
class ScriptedRandomSource final : public detplan::baselines::IRandomSource {
public:
  ScriptedRandomSource(std::vector<std::uint64_t> values, std::size_t* draws)
      : values_(std::move(values)), draws_(draws) {}

  std::uint64_t NextU64() override {
    const std::uint64_t value = values_[next_ % values_.size()];
    ++next_;
    if (draws_ != nullptr) {
      ++*draws_;
    }
    return value;
  }

private:
  std::vector<std::uint64_t> values_;
  std::size_t next_ = 0;
  std::size_t* draws_ = nullptr;
};

std::string GenerateScripted(std::vector<std::uint64_t> values, std::size_t& draws) {
  detplan::baselines::DriftPlanGenerator generator(
      std::make_unique<ScriptedRandomSource>(std::move(values), &draws));
  detplan::planner::Plan plan;
  std::string error;
  if (!generator.Generate("Q", plan, error)) {
    Fail("scripted drift generation failed: " + error);
  }
  return detplan::planner::ToJson(plan);
}

void AssertShuffledAndPerturbed() {
  std::size_t draws = 0;
  const std::string json = GenerateScripted({0, 0, 10, 2, 1}, draws);
  AssertEqual(json,
              R"({"goal":"mock_dynamic_plan","original_request":"Q","steps":[)"
              R"({"id":1,"action":"summarize","params":{"style":"short","max_words":250}},)"
              R"({"id":2,"action":"reflect","params":{"check_consistency":true}},)"
              R"({"id":3,"action":"search","params":{"source":"web","query":"Q","top_k":4}}],)"
              R"("constraints":{"max_latency_ms":null,"must_be_reproducible":false}})",
              "shuffled and perturbed drift plan");
  if (draws != 5U) {
    Fail("perturbed drift plan should take 2 shuffle, 1 coin and 2 parameter draws");
  }
}

void AssertIdentityShuffleWithoutPerturbation() {
  std::size_t draws = 0;
  const std::string json = GenerateScripted({2, 1, 99}, draws);
  AssertEqual(json,
              R"({"goal":"mock_dynamic_plan","original_request":"Q","steps":[)"
              R"({"id":1,"action":"search","params":{"source":"web","query":"Q","top_k":3}},)"
              R"({"id":2,"action":"summarize","params":{"style":"short","max_words":200}},)"
              R"({"id":3,"action":"reflect","params":{"check_consistency":true}}],)"
              R"("constraints":{"max_latency_ms":null,"must_be_reproducible":false}})",
              "unperturbed drift plan");
  if (draws != 3U) {
    Fail("unperturbed drift plan should take 2 shuffle draws and 1 coin draw");
  }
}

void AssertMissingRandomSourceFails() {
  detplan::baselines::DriftPlanGenerator generator(nullptr);
  detplan::planner::Plan plan;
  std::string error;
  if (generator.Generate("Q", plan, error)) {
    Fail("drift generator without a random source should fail");
  }
  AssertContains(error, "no random source");
}

std::vector<std::string> SeededRun(std::uint64_t seed, std::size_t trials) {
  detplan::baselines::DriftPlanGenerator generator(
      std::make_unique<detplan::baselines::SplitMixRandomSource>(seed));
  detplan::planner::TrialResult result;
  std::string error;
  if (!detplan::planner::RunTrials(generator, "Hello there", trials, result, error)) {
    Fail("seeded drift trials failed: " + error);
  }
  if (result.distinct_count <= 1U) {
    Fail("seeded drift run should show more than one distinct plan");
  }

  std::vector<std::string> forms;
  for (const auto& plan : result.plans) {
    forms.push_back(detplan::planner::Canonicalize(plan));
  }
  return forms;
}

void AssertSeededRunsReplay() {
  if (SeededRun(42, 10) != SeededRun(42, 10)) {
    Fail("same seed should replay the same drift plans");
  }
  if (SeededRun(42, 10) == SeededRun(43, 10)) {
    Fail("different seeds should not replay identical drift sequences");
  }
}

void AssertRandomSourceHelpers() {
  detplan::baselines::SplitMixRandomSource first(99);
  detplan::baselines::SplitMixRandomSource second(99);
  for (int i = 0; i < 8; ++i) {
    if (first.NextU64() != second.NextU64()) {
      Fail("SplitMix streams with equal seeds diverged");
    }
  }
  if (first.Seed() != 99U) {
    Fail("SplitMix source should report its seed");
  }
  if (detplan::baselines::UniformIndex(first, 0) != 0U) {
    Fail("UniformIndex with bound 0 should yield 0");
  }
  for (int i = 0; i < 32; ++i) {
    if (detplan::baselines::UniformIndex(first, 3) >= 3U) {
      Fail("UniformIndex escaped its bound");
    }
    if (!detplan::baselines::PercentChance(first, 100)) {
      Fail("PercentChance(100) should always be true");
    }
    if (detplan::baselines::PercentChance(first, 0)) {
      Fail("PercentChance(0) should never be true");
    }
  }
  if (detplan::baselines::DeriveWorkerSeed(5, 0) == detplan::baselines::DeriveWorkerSeed(5, 1)) {
    Fail("worker seeds should differ per worker");
  }
}

} // namespace

int main() {
  AssertShuffledAndPerturbed();
  AssertIdentityShuffleWithoutPerturbation();
  AssertMissingRandomSourceFails();
  AssertSeededRunsReplay();
  AssertRandomSourceHelpers();

  std::cout << "drift_plan_generator_smoke: ok\n";
  return 0;
}
