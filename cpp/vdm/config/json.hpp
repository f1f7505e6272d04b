#pragma once
/*
================================================================================
Fragment 5.3 - Config: JSON Reader / Writer
FILE: cpp/vdm/config/json.hpp

Purpose:
  - Read model config and parameter snapshot documents into a JsonValue
    tree that keeps source positions, so schema errors can point at the
    offending value.
  - Emit deterministic, round-trip exact JSON for snapshots and reports.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vdm::config {

struct JsonParseError {
  std::string message;
  size_t offset = 0;  // byte offset in input
  int line = 1;       // 1-based
  int col = 1;        // 1-based

  std::string describe() const;
};

enum class JsonType { kNull, kBool, kNum, kStr, kObj, kArr };

const char* to_string(JsonType t) noexcept;

/// Parsed JSON value. Objects keep members in document order; lookups
/// return the last occurrence of a duplicated key.
struct JsonValue {
  JsonType t = JsonType::kNull;
  bool b = false;
  double num = 0.0;
  std::string str;
  std::vector<std::pair<std::string, JsonValue>> obj;
  std::vector<JsonValue> arr;

  // Where the value starts in the source text.
  size_t offset = 0;
  int line = 1;
  int col = 1;

  const JsonValue* find(std::string_view key) const noexcept;

  bool is_null() const noexcept { return t == JsonType::kNull; }
  bool is_object() const noexcept { return t == JsonType::kObj; }
  bool is_array() const noexcept { return t == JsonType::kArr; }
};

/// Parse a complete JSON document.
/// - Rejects NaN/Inf numeric literals (not valid JSON).
/// - Rejects trailing characters after the root value.
bool parse_json(std::string_view json, JsonValue* out, JsonParseError* err = nullptr);

/// Stream convenience (reads full stream into memory).
bool parse_json(std::istream& is, JsonValue* out, JsonParseError* err = nullptr);

/// Escape for embedding inside a JSON string literal (no surrounding quotes).
std::string json_escape(std::string_view s);

/// Deterministic pretty-printing emitter. Commas and indentation are
/// inserted automatically; callers only open, key, write and close.
/// Non-finite numbers serialize as null. Numbers use the shortest
/// representation that parses back to the same double.
class JsonWriter {
 public:
  explicit JsonWriter(int indent = 2);

  void obj_begin();
  void obj_end();
  void arr_begin();
  void arr_end();

  void key(std::string_view k);

  void str(std::string_view v);
  void b(bool v);
  void null();
  void num(double v);
  void num_u(std::uint64_t v);
  void num_i(long long v);
  void num_list(const std::vector<double>& v);
  void str_list(const std::vector<std::string>& v);

  std::string text() const { return out_.str(); }

 private:
  void nl();
  void before_value();

  std::ostringstream out_;
  int indent_ = 2;
  std::vector<bool> has_items_;
  bool after_key_ = false;
};

}  // namespace vdm::config
