#ifndef DETPLAN_CORE_JSON_WRITER_HPP_
#define DETPLAN_CORE_JSON_WRITER_HPP_

#include "core/json_dom.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace detplan::core::json {

struct WriteOptions {
  // false: one line, `,` and `:` separators without padding.
  // true: one member/element per line, `": "` separators, `indent` spaces.
  bool pretty = false;
  std::size_t indent = 2;
};

// Streaming JSON writer shared by every JSON surface in the project.
//
// Callers drive structure explicitly (BeginObject/Key/.../EndObject), which
// lets plan output keep schema field order, while `Write(const Value&)` emits
// DOM values with their map-sorted key order for canonical forms.
class Writer {
public:
  explicit Writer(WriteOptions options = {});

  void BeginObject();
  void EndObject();
  void BeginArray();
  void EndArray();

  // Emits an object key. The next value call supplies its value.
  void Key(std::string_view key);

  void String(std::string_view value);
  void Number(double value);
  void Integer(std::int64_t value);
  void Bool(bool value);
  void Null();
  void Write(const Value& value);

  const std::string& Str() const {
    return out_;
  }

private:
  struct Frame {
    bool is_object = false;
    std::size_t count = 0;
  };

  void BeforeValue();
  void NewLine(std::size_t depth);

  WriteOptions options_;
  std::string out_;
  std::vector<Frame> stack_;
  bool after_key_ = false;
};

// Serializes a DOM value in one call.
std::string ToString(const Value& value, const WriteOptions& options = {});

} // namespace detplan::core::json

#endif // DETPLAN_CORE_JSON_WRITER_HPP_
