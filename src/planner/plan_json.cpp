#include "planner/plan_json.hpp"

#include "core/json_dom.hpp"
#include "core/json_writer.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>

namespace detplan::planner {

namespace {

using JsonValue = core::json::Value;

constexpr std::string_view kRootFields[] = {"goal", "original_request", "steps", "constraints"};
constexpr std::string_view kStepFields[] = {"id", "action", "params"};
constexpr std::string_view kConstraintFields[] = {"max_latency_ms", "must_be_reproducible"};

void WriteStep(core::json::Writer& writer, const Step& step) {
  writer.BeginObject();
  writer.Key("id");
  writer.Integer(step.id);
  writer.Key("action");
  writer.String(step.action);
  writer.Key("params");
  writer.BeginObject();
  for (const auto& param : step.params) {
    writer.Key(param.name);
    writer.Write(param.value);
  }
  writer.EndObject();
  writer.EndObject();
}

void AddIssue(PlanValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

const JsonValue* GetField(const JsonValue& object_value, std::string_view key) {
  if (object_value.type != JsonValue::Type::kObject) {
    return nullptr;
  }
  const auto it = object_value.object_value.find(std::string(key));
  if (it == object_value.object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

template <std::size_t N>
void ValidateKnownFields(const JsonValue& object_value, const std::string_view (&known)[N],
                         const std::string& path, PlanValidationReport& report) {
  for (const auto& entry : object_value.object_value) {
    const std::string& key = entry.first;
    bool is_known = false;
    for (const std::string_view candidate : known) {
      if (candidate == key) {
        is_known = true;
        break;
      }
    }
    if (!is_known) {
      AddIssue(report, path + "." + key, "unknown field");
    }
  }
}

bool TryGetInteger(const JsonValue& value, std::int64_t& out) {
  if (value.type != JsonValue::Type::kNumber || !std::isfinite(value.number_value)) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value) {
    return false;
  }
  if (std::fabs(floored) > 9007199254740992.0) {
    return false;
  }
  out = static_cast<std::int64_t>(floored);
  return true;
}

void ReadRequiredString(const JsonValue& object_value, std::string_view key,
                        const std::string& path, bool allow_empty, std::string& out,
                        PlanValidationReport& report) {
  const JsonValue* field = GetField(object_value, key);
  if (field == nullptr) {
    AddIssue(report, path, "is required");
    return;
  }
  if (field->type != JsonValue::Type::kString) {
    AddIssue(report, path, "must be a string");
    return;
  }
  if (!allow_empty && field->string_value.empty()) {
    AddIssue(report, path, "must not be empty");
    return;
  }
  out = field->string_value;
}

void ValidateStep(const JsonValue& step_value, std::size_t index, Plan& plan,
                  PlanValidationReport& report) {
  const std::string path = "$.steps[" + std::to_string(index) + "]";
  if (step_value.type != JsonValue::Type::kObject) {
    AddIssue(report, path, "must be an object");
    return;
  }
  ValidateKnownFields(step_value, kStepFields, path, report);

  Step step;
  const JsonValue* id = GetField(step_value, "id");
  std::int64_t id_number = 0;
  if (id == nullptr) {
    AddIssue(report, path + ".id", "is required");
  } else if (!TryGetInteger(*id, id_number) || id_number <= 0) {
    AddIssue(report, path + ".id", "must be a positive integer");
  } else if (id_number != static_cast<std::int64_t>(index + 1U)) {
    AddIssue(report, path + ".id",
             "must equal " + std::to_string(index + 1U) + " (ids are 1-based and contiguous)");
  } else {
    step.id = static_cast<std::uint32_t>(id_number);
  }

  ReadRequiredString(step_value, "action", path + ".action", false, step.action, report);

  const JsonValue* params = GetField(step_value, "params");
  if (params == nullptr) {
    AddIssue(report, path + ".params", "is required");
  } else if (params->type != JsonValue::Type::kObject) {
    AddIssue(report, path + ".params", "must be an object");
  } else {
    for (const auto& [name, value] : params->object_value) {
      step.params.push_back({.name = name, .value = value});
    }
  }

  plan.steps.push_back(std::move(step));
}

void ValidateConstraints(const JsonValue& root, Plan& plan, PlanValidationReport& report) {
  const JsonValue* constraints = GetField(root, "constraints");
  if (constraints == nullptr) {
    AddIssue(report, "$.constraints", "is required");
    return;
  }
  if (constraints->type != JsonValue::Type::kObject) {
    AddIssue(report, "$.constraints", "must be an object");
    return;
  }
  ValidateKnownFields(*constraints, kConstraintFields, "$.constraints", report);

  const JsonValue* max_latency = GetField(*constraints, "max_latency_ms");
  std::int64_t latency = 0;
  if (max_latency == nullptr) {
    AddIssue(report, "$.constraints.max_latency_ms", "is required (integer or null)");
  } else if (max_latency->type == JsonValue::Type::kNull) {
    plan.constraints.max_latency_ms.reset();
  } else if (!TryGetInteger(*max_latency, latency) || latency < 0) {
    AddIssue(report, "$.constraints.max_latency_ms", "must be a non-negative integer or null");
  } else {
    plan.constraints.max_latency_ms = latency;
  }

  const JsonValue* reproducible = GetField(*constraints, "must_be_reproducible");
  if (reproducible == nullptr) {
    AddIssue(report, "$.constraints.must_be_reproducible", "is required");
  } else if (reproducible->type != JsonValue::Type::kBool) {
    AddIssue(report, "$.constraints.must_be_reproducible", "must be a boolean");
  } else {
    plan.constraints.must_be_reproducible = reproducible->bool_value;
  }
}

} // namespace

std::string ToJson(const Plan& plan, JsonStyle style) {
  core::json::Writer writer(core::json::WriteOptions{.pretty = style == JsonStyle::kPretty});

  writer.BeginObject();
  writer.Key("goal");
  writer.String(plan.goal);
  writer.Key("original_request");
  writer.String(plan.original_request);

  writer.Key("steps");
  writer.BeginArray();
  for (const auto& step : plan.steps) {
    WriteStep(writer, step);
  }
  writer.EndArray();

  writer.Key("constraints");
  writer.BeginObject();
  writer.Key("max_latency_ms");
  if (plan.constraints.max_latency_ms.has_value()) {
    writer.Integer(*plan.constraints.max_latency_ms);
  } else {
    writer.Null();
  }
  writer.Key("must_be_reproducible");
  writer.Bool(plan.constraints.must_be_reproducible);
  writer.EndObject();

  writer.EndObject();
  return writer.Str();
}

void ParsePlanJson(std::string_view json_text, Plan& plan, PlanValidationReport& report) {
  plan = Plan{};
  report = PlanValidationReport{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", parse_error);
    return;
  }
  if (root.type != JsonValue::Type::kObject) {
    AddIssue(report, "$", "plan document must be a JSON object");
    return;
  }
  ValidateKnownFields(root, kRootFields, "$", report);

  ReadRequiredString(root, "goal", "$.goal", false, plan.goal, report);
  ReadRequiredString(root, "original_request", "$.original_request", true,
                     plan.original_request, report);

  const JsonValue* steps = GetField(root, "steps");
  if (steps == nullptr) {
    AddIssue(report, "$.steps", "is required");
  } else if (steps->type != JsonValue::Type::kArray) {
    AddIssue(report, "$.steps", "must be an array");
  } else {
    for (std::size_t i = 0; i < steps->array_value.size(); ++i) {
      ValidateStep(steps->array_value[i], i, plan, report);
    }
  }

  ValidateConstraints(root, plan, report);

  report.valid = report.issues.empty();
  if (!report.valid) {
    plan = Plan{};
  }
}

bool LoadPlanFile(const std::filesystem::path& path, Plan& plan, PlanValidationReport& report,
                  std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open plan file: " + path.string();
    return false;
  }

  const std::string contents((std::istreambuf_iterator<char>(input)),
                             std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed to read plan file: " + path.string();
    return false;
  }

  error.clear();
  ParsePlanJson(contents, plan, report);
  return true;
}

} // namespace detplan::planner
