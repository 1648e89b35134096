#include "baselines/random_source.hpp"

#include <chrono>
#include <random>

namespace detplan::baselines {

namespace {

constexpr std::uint64_t kSplitMixIncrement = 0x9e3779b97f4a7c15ULL;
constexpr std::uint64_t kWorkerSeedSalt = 0xa0761d6478bd642fULL;

std::uint64_t Mix(std::uint64_t state) {
  state = (state ^ (state >> 30)) * 0xbf58476d1ce4e5b9ULL;
  state = (state ^ (state >> 27)) * 0x94d049bb133111ebULL;
  return state ^ (state >> 31);
}

} // namespace

SplitMixRandomSource::SplitMixRandomSource(std::uint64_t seed) : seed_(seed), state_(seed) {}

std::uint64_t SplitMixRandomSource::NextU64() {
  state_ += kSplitMixIncrement;
  return Mix(state_);
}

std::size_t UniformIndex(IRandomSource& source, std::size_t bound) {
  if (bound == 0U) {
    return 0U;
  }
  return static_cast<std::size_t>(source.NextU64() % static_cast<std::uint64_t>(bound));
}

bool PercentChance(IRandomSource& source, std::uint32_t percent) {
  if (percent >= 100U) {
    return true;
  }
  return source.NextU64() % 100ULL < percent;
}

std::uint64_t SeedFromEntropy() {
  std::random_device device;
  const std::uint64_t high = static_cast<std::uint64_t>(device()) << 32U;
  const std::uint64_t low = static_cast<std::uint64_t>(device());
  const auto now = static_cast<std::uint64_t>(
      std::chrono::steady_clock::now().time_since_epoch().count());
  return Mix((high | low) ^ now);
}

std::uint64_t DeriveWorkerSeed(std::uint64_t run_seed, std::size_t worker_index) {
  return Mix((run_seed ^ kWorkerSeedSalt) +
             static_cast<std::uint64_t>(worker_index + 1U) * kSplitMixIncrement);
}

} // namespace detplan::baselines
