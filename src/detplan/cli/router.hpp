#pragma once

#include "core/logging/logger.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace detplan::cli {

inline constexpr std::string_view kDefaultReproRequest =
    "Find 3 recent papers on deterministic AI agents and summarize the key patterns.";
inline constexpr std::size_t kDefaultReproTrials = 10;

enum class BaselineKind {
  kDrift,
  kRemote,
};

// `detplan plan` / `detplan --goal ...` options.
struct PlanOptions {
  std::string goal;
  bool has_goal = false;
  bool pretty = false;
  std::optional<core::logging::LogLevel> log_level;
};

// `detplan repro` options. An unset seed means "draw one from entropy"; the
// chosen seed is logged so a drifting run can be replayed with --seed.
struct ReproOptions {
  std::string goal = std::string(kDefaultReproRequest);
  std::size_t trials = kDefaultReproTrials;
  std::size_t workers = 1;
  std::optional<std::uint64_t> seed;
  BaselineKind baseline = BaselineKind::kDrift;
  std::optional<core::logging::LogLevel> log_level;
};

// `detplan canonicalize` / `detplan verify` options.
struct PlanFileOptions {
  std::string plan_path;
  std::optional<core::logging::LogLevel> log_level;
};

// Routes `detplan` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args / missing --goal)
//   10 => plan file failed schema validation
//   20 => remote planning integration is not implemented
//   30 => reproducibility check failed
//
// A first argument starting with `--` is treated as `plan`, so
// `detplan --goal "..." --pretty` works without a subcommand.
int Dispatch(int argc, char** argv);

} // namespace detplan::cli
