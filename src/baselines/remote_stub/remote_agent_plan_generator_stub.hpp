#pragma once

#include "planner/plan_generator.hpp"

#include <string>
#include <string_view>

namespace detplan::baselines::remote_stub {

// Coordinates a hosted planning-agent integration would need. They are kept
// so the boundary is explicit; nothing here opens a connection.
struct RemoteAgentConfig {
  std::string agent_id;
  std::string agent_alias_id;
  std::string region = "us-east-1";
  std::string session_id = "detplan-session";
};

// Placeholder for planning through a hosted inference agent.
//
// Every Generate() call fails immediately with a "not implemented" error.
// It never fabricates a plan, so harness runs against it fail loudly instead
// of reporting a misleading distinct count.
class RemoteAgentPlanGeneratorStub final : public planner::IPlanGenerator {
public:
  explicit RemoteAgentPlanGeneratorStub(RemoteAgentConfig config = {});

  std::string_view Name() const override;
  bool Generate(std::string_view request, planner::Plan& plan, std::string& error) override;

  const RemoteAgentConfig& Config() const {
    return config_;
  }

private:
  RemoteAgentConfig config_;
};

} // namespace detplan::baselines::remote_stub
