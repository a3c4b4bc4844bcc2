#include "llmgate/common/json.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace llmgate::common {

namespace {

void append_indent(std::string &out, const int indent, const int depth) {
  if (indent <= 0) {
    return;
  }
  out.push_back('\n');
  out.append(static_cast<std::size_t>(indent * depth), ' ');
}

std::string format_double(const double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  char buffer[64];
  const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (ec != std::errc()) {
    return "null";
  }
  std::string text(buffer, ptr);
  if (text.find_first_of(".eE") == std::string::npos) {
    text += ".0";
  }
  return text;
}

class Parser {
public:
  explicit Parser(const std::string &text) : text_(text) {}

  Result<JsonValue> parse_document() {
    auto value = parse_value(0);
    if (!value.ok()) {
      return value;
    }
    skip_ws();
    if (pos_ != text_.size()) {
      return fail("trailing characters");
    }
    return value;
  }

private:
  static constexpr int kMaxDepth = 128;

  Result<JsonValue> fail(const std::string &what) const {
    return Result<JsonValue>::failure("json parse error at offset " + std::to_string(pos_) +
                                      ": " + what);
  }

  void skip_ws() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
  }

  bool consume_literal(const char *literal) {
    const std::string expected(literal);
    if (text_.compare(pos_, expected.size(), expected) == 0) {
      pos_ += expected.size();
      return true;
    }
    return false;
  }

  Result<JsonValue> parse_value(const int depth) {
    if (depth > kMaxDepth) {
      return fail("nesting too deep");
    }
    skip_ws();
    if (pos_ >= text_.size()) {
      return fail("unexpected end of input");
    }
    const char ch = text_[pos_];
    if (ch == '{') {
      return parse_object(depth);
    }
    if (ch == '[') {
      return parse_array(depth);
    }
    if (ch == '"') {
      auto str = parse_string();
      if (!str.ok()) {
        return Result<JsonValue>::failure(str.error());
      }
      return Result<JsonValue>::success(JsonValue(str.value()));
    }
    if (consume_literal("true")) {
      return Result<JsonValue>::success(JsonValue(true));
    }
    if (consume_literal("false")) {
      return Result<JsonValue>::success(JsonValue(false));
    }
    if (consume_literal("null")) {
      return Result<JsonValue>::success(JsonValue(nullptr));
    }
    return parse_number();
  }

  Result<JsonValue> parse_object(const int depth) {
    ++pos_;
    JsonValue::Object object;
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return Result<JsonValue>::success(JsonValue(std::move(object)));
    }
    while (true) {
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != '"') {
        return fail("expected object key");
      }
      auto key = parse_string();
      if (!key.ok()) {
        return Result<JsonValue>::failure(key.error());
      }
      skip_ws();
      if (pos_ >= text_.size() || text_[pos_] != ':') {
        return fail("expected ':'");
      }
      ++pos_;
      auto value = parse_value(depth + 1);
      if (!value.ok()) {
        return value;
      }
      object[key.value()] = std::move(value.value());
      skip_ws();
      if (pos_ < text_.size() && text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (pos_ < text_.size() && text_[pos_] == '}') {
        ++pos_;
        return Result<JsonValue>::success(JsonValue(std::move(object)));
      }
      return fail("expected ',' or '}'");
    }
  }

  Result<JsonValue> parse_array(const int depth) {
    ++pos_;
    JsonValue::Array array;
    skip_ws();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return Result<JsonValue>::success(JsonValue(std::move(array)));
    }
    while (true) {
      auto value = parse_value(depth + 1);
      if (!value.ok()) {
        return value;
      }
      array.push_back(std::move(value.value()));
      skip_ws();
      if (pos_ < text_.size() && text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (pos_ < text_.size() && text_[pos_] == ']') {
        ++pos_;
        return Result<JsonValue>::success(JsonValue(std::move(array)));
      }
      return fail("expected ',' or ']'");
    }
  }

  static void append_utf8(std::string &out, const std::uint32_t cp) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  bool read_hex4(std::uint32_t &out) {
    if (pos_ + 4 > text_.size()) {
      return false;
    }
    out = 0;
    for (int i = 0; i < 4; ++i) {
      const char ch = text_[pos_++];
      out <<= 4;
      if (ch >= '0' && ch <= '9') {
        out |= static_cast<std::uint32_t>(ch - '0');
      } else if (ch >= 'a' && ch <= 'f') {
        out |= static_cast<std::uint32_t>(ch - 'a' + 10);
      } else if (ch >= 'A' && ch <= 'F') {
        out |= static_cast<std::uint32_t>(ch - 'A' + 10);
      } else {
        return false;
      }
    }
    return true;
  }

  Result<std::string> parse_string() {
    ++pos_;
    std::string out;
    while (pos_ < text_.size()) {
      const char ch = text_[pos_++];
      if (ch == '"') {
        return Result<std::string>::success(std::move(out));
      }
      if (ch != '\\') {
        out.push_back(ch);
        continue;
      }
      if (pos_ >= text_.size()) {
        break;
      }
      const char esc = text_[pos_++];
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        out.push_back(esc);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!read_hex4(cp)) {
          return Result<std::string>::failure("invalid unicode escape");
        }
        if (cp >= 0xD800 && cp <= 0xDBFF && text_.compare(pos_, 2, "\\u") == 0) {
          pos_ += 2;
          std::uint32_t low = 0;
          if (!read_hex4(low) || low < 0xDC00 || low > 0xDFFF) {
            return Result<std::string>::failure("invalid surrogate pair");
          }
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
        append_utf8(out, cp);
        break;
      }
      default:
        return Result<std::string>::failure("invalid escape sequence");
      }
    }
    return Result<std::string>::failure("unterminated string");
  }

  Result<JsonValue> parse_number() {
    const std::size_t start = pos_;
    bool is_float = false;
    if (pos_ < text_.size() && text_[pos_] == '-') {
      ++pos_;
    }
    while (pos_ < text_.size()) {
      const char ch = text_[pos_];
      if (std::isdigit(static_cast<unsigned char>(ch)) != 0) {
        ++pos_;
      } else if (ch == '.' || ch == 'e' || ch == 'E' || ch == '+' || ch == '-') {
        is_float = true;
        ++pos_;
      } else {
        break;
      }
    }
    if (pos_ == start) {
      return fail("unexpected character");
    }
    const char *first = text_.data() + start;
    const char *last = text_.data() + pos_;
    if (!is_float) {
      std::int64_t parsed = 0;
      const auto [ptr, ec] = std::from_chars(first, last, parsed);
      if (ec == std::errc() && ptr == last) {
        return Result<JsonValue>::success(JsonValue(parsed));
      }
    }
    double parsed = 0.0;
    const auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc() || ptr != last) {
      return fail("invalid number");
    }
    return Result<JsonValue>::success(JsonValue(parsed));
  }

  const std::string &text_;
  std::size_t pos_ = 0;
};

} // namespace

bool JsonValue::as_bool() const {
  if (const auto *value = std::get_if<bool>(&value_)) {
    return *value;
  }
  throw std::logic_error("json value is not a bool");
}

std::int64_t JsonValue::as_int() const {
  if (const auto *value = std::get_if<std::int64_t>(&value_)) {
    return *value;
  }
  if (const auto *value = std::get_if<double>(&value_)) {
    return static_cast<std::int64_t>(*value);
  }
  throw std::logic_error("json value is not a number");
}

double JsonValue::as_double() const {
  if (const auto *value = std::get_if<double>(&value_)) {
    return *value;
  }
  if (const auto *value = std::get_if<std::int64_t>(&value_)) {
    return static_cast<double>(*value);
  }
  throw std::logic_error("json value is not a number");
}

const std::string &JsonValue::as_string() const {
  if (const auto *value = std::get_if<std::string>(&value_)) {
    return *value;
  }
  throw std::logic_error("json value is not a string");
}

const JsonValue::Array &JsonValue::as_array() const {
  if (const auto *value = std::get_if<Array>(&value_)) {
    return *value;
  }
  throw std::logic_error("json value is not an array");
}

JsonValue::Array &JsonValue::as_array() {
  if (auto *value = std::get_if<Array>(&value_)) {
    return *value;
  }
  throw std::logic_error("json value is not an array");
}

const JsonValue::Object &JsonValue::as_object() const {
  if (const auto *value = std::get_if<Object>(&value_)) {
    return *value;
  }
  throw std::logic_error("json value is not an object");
}

JsonValue::Object &JsonValue::as_object() {
  if (auto *value = std::get_if<Object>(&value_)) {
    return *value;
  }
  throw std::logic_error("json value is not an object");
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (is_null()) {
    value_ = Object{};
  }
  return as_object()[key];
}

const JsonValue *JsonValue::find(const std::string &key) const {
  const auto *object = std::get_if<Object>(&value_);
  if (object == nullptr) {
    return nullptr;
  }
  const auto it = object->find(key);
  return it == object->end() ? nullptr : &it->second;
}

void JsonValue::push_back(JsonValue value) {
  if (is_null()) {
    value_ = Array{};
  }
  as_array().push_back(std::move(value));
}

std::size_t JsonValue::size() const {
  if (const auto *array = std::get_if<Array>(&value_)) {
    return array->size();
  }
  if (const auto *object = std::get_if<Object>(&value_)) {
    return object->size();
  }
  return 0;
}

std::string JsonValue::dump() const {
  std::string out;
  write(out, 0, 0);
  return out;
}

std::string JsonValue::dump_pretty(const int indent) const {
  std::string out;
  write(out, indent, 0);
  return out;
}

void JsonValue::write(std::string &out, const int indent, const int depth) const {
  if (std::holds_alternative<std::nullptr_t>(value_)) {
    out += "null";
  } else if (const auto *b = std::get_if<bool>(&value_)) {
    out += *b ? "true" : "false";
  } else if (const auto *i = std::get_if<std::int64_t>(&value_)) {
    out += std::to_string(*i);
  } else if (const auto *d = std::get_if<double>(&value_)) {
    out += format_double(*d);
  } else if (const auto *s = std::get_if<std::string>(&value_)) {
    out.push_back('"');
    out += json_escape(*s);
    out.push_back('"');
  } else if (const auto *array = std::get_if<Array>(&value_)) {
    out.push_back('[');
    bool first = true;
    for (const auto &item : *array) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      append_indent(out, indent, depth + 1);
      item.write(out, indent, depth + 1);
    }
    if (!array->empty()) {
      append_indent(out, indent, depth);
    }
    out.push_back(']');
  } else if (const auto *object = std::get_if<Object>(&value_)) {
    out.push_back('{');
    bool first = true;
    for (const auto &[key, item] : *object) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      append_indent(out, indent, depth + 1);
      out.push_back('"');
      out += json_escape(key);
      out += indent > 0 ? "\": " : "\":";
      item.write(out, indent, depth + 1);
    }
    if (!object->empty()) {
      append_indent(out, indent, depth);
    }
    out.push_back('}');
  }
}

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

Result<JsonValue> parse_json(const std::string &text) { return Parser(text).parse_document(); }

} // namespace llmgate::common
