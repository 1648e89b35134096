#include "detplan/cli/router.hpp"

#include "baselines/drift_plan_generator.hpp"
#include "baselines/random_source.hpp"
#include "baselines/remote_stub/remote_agent_plan_generator_stub.hpp"
#include "core/errors/exit_codes.hpp"
#include "planner/canonicalizer.hpp"
#include "planner/plan_assembler.hpp"
#include "planner/plan_json.hpp"
#include "planner/repro_report.hpp"
#include "planner/reproducibility_harness.hpp"

#include <charconv>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace detplan::cli {

namespace {

constexpr std::string_view kBaselineDrift = "drift";
constexpr std::string_view kBaselineRemote = "remote";

// Keep local names for readability while using one shared core contract.
constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitPlanSchemaInvalid =
    core::errors::ToInt(core::errors::ExitCode::kPlanSchemaInvalid);
constexpr int kExitNotImplemented = core::errors::ToInt(core::errors::ExitCode::kNotImplemented);
constexpr int kExitReproducibilityFailed =
    core::errors::ToInt(core::errors::ExitCode::kReproducibilityFailed);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  detplan --goal <text> [--pretty] [--log-level <debug|info|warn|error>]\n"
      << "  detplan plan --goal <text> [--pretty] [--log-level <debug|info|warn|error>]\n"
      << "  detplan repro [--goal <text>] [--trials <n>] [--workers <n>] [--seed <n>] "
         "[--baseline <drift|remote>] [--log-level <debug|info|warn|error>]\n"
      << "  detplan canonicalize <plan.json> [--log-level <debug|info|warn|error>]\n"
      << "  detplan verify <plan.json> [--log-level <debug|info|warn|error>]\n"
      << "  detplan version\n";
}

bool ParseUInt64(std::string_view text, std::uint64_t& value) {
  if (text.empty()) {
    return false;
  }

  std::uint64_t parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return false;
  }

  value = parsed;
  return true;
}

bool ParsePositiveCount(std::string_view flag, std::string_view text, std::size_t& value,
                        std::string& error) {
  std::uint64_t parsed = 0;
  if (!ParseUInt64(text, parsed) || parsed == 0U) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(text) +
            "' (expected a positive integer)";
    return false;
  }
  value = static_cast<std::size_t>(parsed);
  return true;
}

// Shared `--log-level <value>` handling for every subcommand parser.
// Returns true when `token` was the log-level flag (consumed or failed).
bool TryConsumeLogLevel(const std::vector<std::string_view>& args, std::size_t& i,
                        std::optional<core::logging::LogLevel>& level, bool& ok,
                        std::string& error) {
  if (args[i] != "--log-level") {
    return false;
  }
  if (i + 1 >= args.size()) {
    error = "missing value for --log-level";
    ok = false;
    return true;
  }
  core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
  if (!core::logging::ParseLogLevel(args[i + 1], parsed, error)) {
    ok = false;
    return true;
  }
  level = parsed;
  ++i;
  ok = true;
  return true;
}

// Env sets the default; an explicit flag wins.
bool ConfigureLogger(const std::optional<core::logging::LogLevel>& flag_level,
                     std::string_view command, core::logging::Logger& logger,
                     std::string& error) {
  core::logging::LogLevel level = core::logging::LogLevel::kInfo;
  if (!core::logging::ResolveLogLevelFromEnv(level, error)) {
    return false;
  }
  if (flag_level.has_value()) {
    level = *flag_level;
  }
  logger.SetMinLevel(level);
  logger.SetCommand(std::string(command));
  return true;
}

constexpr std::string_view kGoalAssignPrefix = "--goal=";

// A flag in the value slot of `--goal` means the value was omitted.
bool IsPlanFlag(std::string_view token) {
  return token == "--goal" || token == "--pretty" || token == "--log-level" ||
         token.rfind(kGoalAssignPrefix, 0) == 0U;
}

// Parse `plan` args with an explicit contract:
// - `--goal <text>` or `--goal=<text>` is required (an empty text is a valid
//   request); a known flag in the value position counts as a missing value
// - optional `--pretty`
// Unknown flags and positional args are usage errors.
bool ParsePlanOptions(const std::vector<std::string_view>& args, PlanOptions& options,
                      std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    bool ok = true;
    if (TryConsumeLogLevel(args, i, options.log_level, ok, error)) {
      if (!ok) {
        return false;
      }
      continue;
    }
    if (token == "--pretty") {
      options.pretty = true;
      continue;
    }
    if (token == "--goal" || token.rfind(kGoalAssignPrefix, 0) == 0U) {
      std::string_view value;
      if (token == "--goal") {
        if (i + 1 >= args.size() || IsPlanFlag(args[i + 1])) {
          error = "missing value for --goal";
          return false;
        }
        value = args[i + 1];
        ++i;
      } else {
        value = token.substr(kGoalAssignPrefix.size());
      }
      if (options.has_goal) {
        error = "--goal may only be given once";
        return false;
      }
      options.goal = std::string(value);
      options.has_goal = true;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    error = "unexpected argument: " + std::string(token);
    return false;
  }

  if (!options.has_goal) {
    error = "plan requires --goal <text>";
    return false;
  }
  return true;
}

bool IsReproValueFlag(std::string_view token) {
  return token == "--goal" || token == "--trials" || token == "--workers" || token == "--seed" ||
         token == "--baseline";
}

bool ParseReproOptions(const std::vector<std::string_view>& args, ReproOptions& options,
                       std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    bool ok = true;
    if (TryConsumeLogLevel(args, i, options.log_level, ok, error)) {
      if (!ok) {
        return false;
      }
      continue;
    }

    const bool takes_value = IsReproValueFlag(token);
    if (!takes_value) {
      if (!token.empty() && token.front() == '-') {
        error = "unknown option: " + std::string(token);
      } else {
        error = "unexpected argument: " + std::string(token);
      }
      return false;
    }
    if (i + 1 >= args.size() || IsReproValueFlag(args[i + 1]) || args[i + 1] == "--log-level") {
      error = "missing value for " + std::string(token);
      return false;
    }
    const std::string_view value = args[i + 1];
    ++i;

    if (token == "--goal") {
      options.goal = std::string(value);
    } else if (token == "--trials") {
      if (!ParsePositiveCount(token, value, options.trials, error)) {
        return false;
      }
    } else if (token == "--workers") {
      if (!ParsePositiveCount(token, value, options.workers, error)) {
        return false;
      }
    } else if (token == "--seed") {
      std::uint64_t seed = 0;
      if (!ParseUInt64(value, seed)) {
        error = "invalid value for --seed: '" + std::string(value) +
                "' (expected an unsigned integer)";
        return false;
      }
      options.seed = seed;
    } else {
      if (value == kBaselineDrift) {
        options.baseline = BaselineKind::kDrift;
      } else if (value == kBaselineRemote) {
        options.baseline = BaselineKind::kRemote;
      } else {
        error = "invalid value for --baseline: '" + std::string(value) +
                "' (expected drift|remote)";
        return false;
      }
    }
  }

  return true;
}

bool ParsePlanFileOptions(std::string_view command, const std::vector<std::string_view>& args,
                          PlanFileOptions& options, std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    bool ok = true;
    if (TryConsumeLogLevel(args, i, options.log_level, ok, error)) {
      if (!ok) {
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.plan_path.empty()) {
      error = std::string(command) + " accepts exactly 1 plan path";
      return false;
    }
    options.plan_path = std::string(token);
  }

  if (options.plan_path.empty()) {
    error = std::string(command) + " requires exactly 1 argument: <plan.json>";
    return false;
  }
  return true;
}

std::string_view ToString(BaselineKind kind) {
  return kind == BaselineKind::kRemote ? kBaselineRemote : kBaselineDrift;
}

planner::PlanGeneratorFactory MakeBaselineFactory(BaselineKind kind, std::uint64_t seed) {
  if (kind == BaselineKind::kRemote) {
    return [](std::size_t) -> std::unique_ptr<planner::IPlanGenerator> {
      return std::make_unique<baselines::remote_stub::RemoteAgentPlanGeneratorStub>();
    };
  }
  return [seed](std::size_t worker_index) -> std::unique_ptr<planner::IPlanGenerator> {
    return std::make_unique<baselines::DriftPlanGenerator>(
        std::make_unique<baselines::SplitMixRandomSource>(
            baselines::DeriveWorkerSeed(seed, worker_index)));
  };
}

// Loads and validates a plan file, printing issues to stderr. Returns an exit
// code, or kExitSuccess with `plan` populated.
int LoadValidatedPlan(const std::string& plan_path, planner::Plan& plan,
                      core::logging::Logger& logger) {
  planner::PlanValidationReport report;
  std::string error;
  if (!planner::LoadPlanFile(plan_path, plan, report, error)) {
    logger.Error("plan file load failed", {{"path", plan_path}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  if (!report.valid) {
    logger.Warn("plan file failed validation",
                {{"path", plan_path}, {"issues", std::to_string(report.issues.size())}});
    std::cerr << "invalid plan: " << plan_path << '\n';
    for (const auto& issue : report.issues) {
      std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
    }
    return kExitPlanSchemaInvalid;
  }
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "detplan 0.1.0\n";
  return kExitSuccess;
}

int CommandPlan(const std::vector<std::string_view>& args) {
  PlanOptions options;
  std::string error;
  if (!ParsePlanOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger;
  if (!ConfigureLogger(options.log_level, "plan", logger, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  const planner::Plan plan = planner::AssemblePlan(options.goal);
  logger.Debug("plan assembled", {{"goal", plan.goal},
                                  {"steps", std::to_string(plan.steps.size())},
                                  {"request_bytes", std::to_string(options.goal.size())}});

  const planner::JsonStyle style =
      options.pretty ? planner::JsonStyle::kPretty : planner::JsonStyle::kCompact;
  std::cout << planner::ToJson(plan, style) << '\n';
  return kExitSuccess;
}

int CommandRepro(const std::vector<std::string_view>& args) {
  ReproOptions options;
  std::string error;
  if (!ParseReproOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger;
  if (!ConfigureLogger(options.log_level, "repro", logger, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  const std::uint64_t seed =
      options.seed.has_value() ? *options.seed : baselines::SeedFromEntropy();
  logger.Info("reproducibility run started",
              {{"trials", std::to_string(options.trials)},
               {"workers", std::to_string(options.workers)},
               {"baseline", ToString(options.baseline)},
               {"seed", std::to_string(seed)}});

  planner::TrialResult deterministic;
  const planner::PlanGeneratorFactory deterministic_factory =
      [](std::size_t) -> std::unique_ptr<planner::IPlanGenerator> {
    return std::make_unique<planner::DeterministicPlanGenerator>();
  };
  if (!planner::RunTrialsParallel(deterministic_factory, options.goal, options.trials,
                                  options.workers, deterministic, error)) {
    logger.Error("deterministic trials failed", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  logger.Debug("deterministic trials finished",
               {{"distinct", std::to_string(deterministic.distinct_count)}});

  planner::TrialResult baseline;
  if (!planner::RunTrialsParallel(MakeBaselineFactory(options.baseline, seed), options.goal,
                                  options.trials, options.workers, baseline, error)) {
    logger.Error("baseline trials failed",
                 {{"baseline", ToString(options.baseline)}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return options.baseline == BaselineKind::kRemote ? kExitNotImplemented : kExitFailure;
  }
  logger.Debug("baseline trials finished",
               {{"distinct", std::to_string(baseline.distinct_count)}});

  planner::ReproReport report;
  report.request = options.goal;
  report.trials = options.trials;
  report.deterministic_distinct = deterministic.distinct_count;
  report.baseline_name = std::string(ToString(options.baseline));
  report.baseline_distinct = baseline.distinct_count;
  planner::WriteReproReport(report, std::cout);

  if (!planner::BaselineShowsDrift(report)) {
    logger.Warn("baseline produced a single distinct plan",
                {{"trials", std::to_string(options.trials)}, {"seed", std::to_string(seed)}});
  }
  if (!planner::DeterministicPathReproducible(report)) {
    logger.Error("deterministic planner is not reproducible",
                 {{"distinct", std::to_string(report.deterministic_distinct)}});
    return kExitReproducibilityFailed;
  }
  return kExitSuccess;
}

int CommandCanonicalize(const std::vector<std::string_view>& args) {
  PlanFileOptions options;
  std::string error;
  if (!ParsePlanFileOptions("canonicalize", args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger;
  if (!ConfigureLogger(options.log_level, "canonicalize", logger, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  planner::Plan plan;
  const int load_status = LoadValidatedPlan(options.plan_path, plan, logger);
  if (load_status != kExitSuccess) {
    return load_status;
  }

  std::cout << planner::Canonicalize(plan) << '\n';
  return kExitSuccess;
}

// Re-plans the stored request and compares canonical forms. A stored plan
// from any non-deterministic source is expected to fail here.
int CommandVerify(const std::vector<std::string_view>& args) {
  PlanFileOptions options;
  std::string error;
  if (!ParsePlanFileOptions("verify", args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger;
  if (!ConfigureLogger(options.log_level, "verify", logger, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  planner::Plan stored;
  const int load_status = LoadValidatedPlan(options.plan_path, stored, logger);
  if (load_status != kExitSuccess) {
    return load_status;
  }

  const planner::Plan replanned = planner::AssemblePlan(stored.original_request);
  const std::string stored_canonical = planner::Canonicalize(stored);
  const std::string replanned_canonical = planner::Canonicalize(replanned);
  if (stored_canonical != replanned_canonical) {
    logger.Warn("plan does not match deterministic re-plan",
                {{"path", options.plan_path},
                 {"stored_goal", stored.goal},
                 {"replanned_goal", replanned.goal}});
    std::cout << "mismatch: " << options.plan_path << '\n'
              << "  stored:    " << stored_canonical << '\n'
              << "  replanned: " << replanned_canonical << '\n';
    return kExitReproducibilityFailed;
  }

  logger.Info("plan verified", {{"path", options.plan_path}, {"goal", stored.goal}});
  std::cout << "verified: " << options.plan_path << '\n';
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);

  // Explicit command dispatch keeps behavior obvious while the command count
  // is small.
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  if (command.size() > 2 && command.substr(0, 2) == "--") {
    return CommandPlan(std::vector<std::string_view>(argv + 1, argv + argc));
  }

  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "plan") {
    return CommandPlan(args);
  }

  if (command == "repro") {
    return CommandRepro(args);
  }

  if (command == "canonicalize") {
    return CommandCanonicalize(args);
  }

  if (command == "verify") {
    return CommandVerify(args);
  }

  if (command == "version") {
    return CommandVersion(args);
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace detplan::cli
