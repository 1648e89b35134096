#include "planner/canonicalizer.hpp"

#include "core/json_writer.hpp"

namespace detplan::planner {

namespace {

using core::json::Value;

Value StepToJsonValue(const Step& step) {
  Value::Object params;
  for (const auto& param : step.params) {
    params[param.name] = param.value;
  }

  Value::Object object;
  object["id"] = core::json::MakeNumber(static_cast<double>(step.id));
  object["action"] = core::json::MakeString(step.action);
  object["params"] = core::json::MakeObject(std::move(params));
  return core::json::MakeObject(std::move(object));
}

Value ConstraintsToJsonValue(const PlanConstraints& constraints) {
  Value::Object object;
  object["max_latency_ms"] =
      constraints.max_latency_ms.has_value()
          ? core::json::MakeNumber(static_cast<double>(*constraints.max_latency_ms))
          : core::json::MakeNull();
  object["must_be_reproducible"] = core::json::MakeBool(constraints.must_be_reproducible);
  return core::json::MakeObject(std::move(object));
}

} // namespace

Value ToJsonValue(const Plan& plan) {
  Value::Array steps;
  steps.reserve(plan.steps.size());
  for (const auto& step : plan.steps) {
    steps.push_back(StepToJsonValue(step));
  }

  Value::Object object;
  object["goal"] = core::json::MakeString(plan.goal);
  object["original_request"] = core::json::MakeString(plan.original_request);
  object["steps"] = core::json::MakeArray(std::move(steps));
  object["constraints"] = ConstraintsToJsonValue(plan.constraints);
  return core::json::MakeObject(std::move(object));
}

std::string Canonicalize(const Plan& plan) {
  return Canonicalize(ToJsonValue(plan));
}

std::string Canonicalize(const core::json::Value& value) {
  return core::json::ToString(value, core::json::WriteOptions{.pretty = false});
}

} // namespace detplan::planner
