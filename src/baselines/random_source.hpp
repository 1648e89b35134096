#pragma once

#include <cstddef>
#include <cstdint>

namespace detplan::baselines {

// Injectable source of randomness for non-deterministic generators.
//
// Implementations are not required to be thread-safe. Code that draws from
// several threads gives each thread its own instance.
class IRandomSource {
public:
  virtual ~IRandomSource() = default;

  virtual std::uint64_t NextU64() = 0;
};

// SplitMix64 stream. Same seed, same sequence, on every platform.
class SplitMixRandomSource final : public IRandomSource {
public:
  explicit SplitMixRandomSource(std::uint64_t seed);

  std::uint64_t NextU64() override;

  std::uint64_t Seed() const {
    return seed_;
  }

private:
  std::uint64_t seed_ = 0;
  std::uint64_t state_ = 0;
};

// Returns a value in [0, bound). `bound == 0` yields 0.
std::size_t UniformIndex(IRandomSource& source, std::size_t bound);

// True with probability `percent`/100. Values above 100 are treated as 100.
bool PercentChance(IRandomSource& source, std::uint32_t percent);

// Seed for runs where the user did not pass one.
std::uint64_t SeedFromEntropy();

// Independent per-worker seed derived from one run seed.
std::uint64_t DeriveWorkerSeed(std::uint64_t run_seed, std::size_t worker_index);

} // namespace detplan::baselines
