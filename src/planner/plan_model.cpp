#include "planner/plan_model.hpp"

#include <utility>

namespace detplan::planner {

const core::json::Value* FindParam(const Step& step, std::string_view name) {
  for (const auto& param : step.params) {
    if (param.name == name) {
      return &param.value;
    }
  }
  return nullptr;
}

void SetParam(Step& step, std::string_view name, core::json::Value value) {
  for (auto& param : step.params) {
    if (param.name == name) {
      param.value = std::move(value);
      return;
    }
  }
  step.params.push_back({.name = std::string(name), .value = std::move(value)});
}

void RenumberSteps(std::vector<Step>& steps) {
  std::uint32_t next_id = 1;
  for (auto& step : steps) {
    step.id = next_id++;
  }
}

bool HasContiguousStepIds(const std::vector<Step>& steps) {
  for (std::size_t i = 0; i < steps.size(); ++i) {
    if (steps[i].id != static_cast<std::uint32_t>(i + 1U)) {
      return false;
    }
  }
  return true;
}

} // namespace detplan::planner
