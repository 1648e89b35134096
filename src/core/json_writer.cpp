#include "core/json_writer.hpp"

#include "core/json_utils.hpp"

namespace detplan::core::json {

Writer::Writer(WriteOptions options) : options_(options) {}

void Writer::BeginObject() {
  BeforeValue();
  out_.push_back('{');
  stack_.push_back({.is_object = true, .count = 0});
}

void Writer::EndObject() {
  if (stack_.empty()) {
    return;
  }
  const Frame frame = stack_.back();
  stack_.pop_back();
  if (options_.pretty && frame.count > 0U) {
    NewLine(stack_.size());
  }
  out_.push_back('}');
}

void Writer::BeginArray() {
  BeforeValue();
  out_.push_back('[');
  stack_.push_back({.is_object = false, .count = 0});
}

void Writer::EndArray() {
  if (stack_.empty()) {
    return;
  }
  const Frame frame = stack_.back();
  stack_.pop_back();
  if (options_.pretty && frame.count > 0U) {
    NewLine(stack_.size());
  }
  out_.push_back(']');
}

void Writer::Key(std::string_view key) {
  if (stack_.empty() || !stack_.back().is_object) {
    return;
  }
  Frame& frame = stack_.back();
  if (frame.count > 0U) {
    out_.push_back(',');
  }
  if (options_.pretty) {
    NewLine(stack_.size());
  }
  ++frame.count;

  out_.push_back('"');
  out_ += EscapeJson(key);
  out_.push_back('"');
  out_ += options_.pretty ? ": " : ":";
  after_key_ = true;
}

void Writer::String(std::string_view value) {
  BeforeValue();
  out_.push_back('"');
  out_ += EscapeJson(value);
  out_.push_back('"');
}

void Writer::Number(double value) {
  BeforeValue();
  out_ += FormatJsonNumber(value);
}

void Writer::Integer(std::int64_t value) {
  BeforeValue();
  out_ += std::to_string(value);
}

void Writer::Bool(bool value) {
  BeforeValue();
  out_ += value ? "true" : "false";
}

void Writer::Null() {
  BeforeValue();
  out_ += "null";
}

void Writer::Write(const Value& value) {
  switch (value.type) {
  case Value::Type::kObject:
    BeginObject();
    for (const auto& [key, member] : value.object_value) {
      Key(key);
      Write(member);
    }
    EndObject();
    return;
  case Value::Type::kArray:
    BeginArray();
    for (const auto& item : value.array_value) {
      Write(item);
    }
    EndArray();
    return;
  case Value::Type::kString:
    String(value.string_value);
    return;
  case Value::Type::kNumber:
    Number(value.number_value);
    return;
  case Value::Type::kBool:
    Bool(value.bool_value);
    return;
  case Value::Type::kNull:
    Null();
    return;
  }
}

void Writer::BeforeValue() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (stack_.empty()) {
    return;
  }

  // Array element.
  Frame& frame = stack_.back();
  if (frame.count > 0U) {
    out_.push_back(',');
  }
  if (options_.pretty) {
    NewLine(stack_.size());
  }
  ++frame.count;
}

void Writer::NewLine(std::size_t depth) {
  out_.push_back('\n');
  out_.append(depth * options_.indent, ' ');
}

std::string ToString(const Value& value, const WriteOptions& options) {
  Writer writer(options);
  writer.Write(value);
  return writer.Str();
}

} // namespace detplan::core::json
