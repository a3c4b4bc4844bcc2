#pragma once

#include "llmgate/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace llmgate::common {

/// Minimal JSON document model. Objects keep their keys sorted so `dump()` is canonical.
class JsonValue {
public:
  using Array = std::vector<JsonValue>;
  using Object = std::map<std::string, JsonValue>;

  JsonValue() : value_(nullptr) {}
  JsonValue(std::nullptr_t) : value_(nullptr) {}
  JsonValue(bool value) : value_(value) {}
  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  JsonValue(T value) : value_(static_cast<std::int64_t>(value)) {}
  JsonValue(double value) : value_(value) {}
  JsonValue(const char *value) : value_(std::string(value)) {}
  JsonValue(std::string value) : value_(std::move(value)) {}
  JsonValue(Array value) : value_(std::move(value)) {}
  JsonValue(Object value) : value_(std::move(value)) {}

  [[nodiscard]] static JsonValue object() { return JsonValue(Object{}); }
  [[nodiscard]] static JsonValue array() { return JsonValue(Array{}); }

  [[nodiscard]] bool is_null() const { return std::holds_alternative<std::nullptr_t>(value_); }
  [[nodiscard]] bool is_bool() const { return std::holds_alternative<bool>(value_); }
  [[nodiscard]] bool is_int() const { return std::holds_alternative<std::int64_t>(value_); }
  [[nodiscard]] bool is_double() const { return std::holds_alternative<double>(value_); }
  [[nodiscard]] bool is_number() const { return is_int() || is_double(); }
  [[nodiscard]] bool is_string() const { return std::holds_alternative<std::string>(value_); }
  [[nodiscard]] bool is_array() const { return std::holds_alternative<Array>(value_); }
  [[nodiscard]] bool is_object() const { return std::holds_alternative<Object>(value_); }

  [[nodiscard]] bool as_bool() const;
  [[nodiscard]] std::int64_t as_int() const;
  [[nodiscard]] double as_double() const;
  [[nodiscard]] const std::string &as_string() const;
  [[nodiscard]] const Array &as_array() const;
  [[nodiscard]] Array &as_array();
  [[nodiscard]] const Object &as_object() const;
  [[nodiscard]] Object &as_object();

  /// Object member access; converts a null value into an empty object first.
  JsonValue &operator[](const std::string &key);
  [[nodiscard]] const JsonValue *find(const std::string &key) const;
  [[nodiscard]] bool contains(const std::string &key) const { return find(key) != nullptr; }
  void push_back(JsonValue value);
  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] std::string dump() const;
  [[nodiscard]] std::string dump_pretty(int indent = 2) const;

  friend bool operator==(const JsonValue &lhs, const JsonValue &rhs) {
    return lhs.value_ == rhs.value_;
  }
  friend bool operator!=(const JsonValue &lhs, const JsonValue &rhs) { return !(lhs == rhs); }

private:
  void write(std::string &out, int indent, int depth) const;

  std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object> value_;
};

[[nodiscard]] std::string json_escape(const std::string &value);

[[nodiscard]] Result<JsonValue> parse_json(const std::string &text);

} // namespace llmgate::common
