#include "baselines/remote_stub/remote_agent_plan_generator_stub.hpp"

#include <utility>

namespace detplan::baselines::remote_stub {

namespace {

std::string DescribeTarget(const RemoteAgentConfig& config) {
  const std::string agent_id = config.agent_id.empty() ? "<unset>" : config.agent_id;
  const std::string alias_id = config.agent_alias_id.empty() ? "<unset>" : config.agent_alias_id;
  return "agent_id=" + agent_id + " alias_id=" + alias_id + " region=" + config.region +
         " session_id=" + config.session_id;
}

} // namespace

RemoteAgentPlanGeneratorStub::RemoteAgentPlanGeneratorStub(RemoteAgentConfig config)
    : config_(std::move(config)) {}

std::string_view RemoteAgentPlanGeneratorStub::Name() const {
  return "remote";
}

bool RemoteAgentPlanGeneratorStub::Generate(std::string_view request, planner::Plan& plan,
                                            std::string& error) {
  plan = planner::Plan{};
  error = "remote planning agent integration is not implemented (" + DescribeTarget(config_) +
          ", request_bytes=" + std::to_string(request.size()) + ")";
  return false;
}

} // namespace detplan::baselines::remote_stub
