/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace OvermapAtlas {

class JsonValue;

using JsonObject = std::unordered_map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

enum class JsonType { Null, Boolean, Number, String, Array, Object };

// Stream operator for JsonType (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, JsonType type) {
  switch (type) {
  case JsonType::Null:
    return os << "Null";
  case JsonType::Boolean:
    return os << "Boolean";
  case JsonType::Number:
    return os << "Number";
  case JsonType::String:
    return os << "String";
  case JsonType::Array:
    return os << "Array";
  case JsonType::Object:
    return os << "Object";
  }
  return os << "Unknown";
}

class JsonValue {
public:
  using ValueType = std::variant<std::nullptr_t, bool, double, std::string,
                                 JsonArray, JsonObject>;

private:
  ValueType m_value;

public:
  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(std::nullptr_t) : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(int value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(const std::string &value) : m_value(value) {}
  explicit JsonValue(std::string &&value) : m_value(std::move(value)) {}
  explicit JsonValue(const char *value) : m_value(std::string(value)) {}
  explicit JsonValue(const JsonArray &value) : m_value(value) {}
  explicit JsonValue(JsonArray &&value) : m_value(std::move(value)) {}
  explicit JsonValue(const JsonObject &value) : m_value(value) {}
  explicit JsonValue(JsonObject &&value) : m_value(std::move(value)) {}

  JsonType getType() const;
  bool isNull() const {
    return std::holds_alternative<std::nullptr_t>(m_value);
  }
  bool isBool() const { return std::holds_alternative<bool>(m_value); }
  bool isNumber() const { return std::holds_alternative<double>(m_value); }
  bool isString() const { return std::holds_alternative<std::string>(m_value); }
  bool isArray() const { return std::holds_alternative<JsonArray>(m_value); }
  bool isObject() const { return std::holds_alternative<JsonObject>(m_value); }

  // Throw std::bad_variant_access on a type mismatch
  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  int asInt() const { return static_cast<int>(std::get<double>(m_value)); }
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }

  JsonArray &asArray() { return std::get<JsonArray>(m_value); }
  JsonObject &asObject() { return std::get<JsonObject>(m_value); }

  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  std::optional<int> tryAsInt() const;
  std::optional<std::string> tryAsString() const;
  const JsonArray *tryAsArray() const;
  const JsonObject *tryAsObject() const;

  bool hasKey(const std::string &key) const;
  const JsonValue &operator[](const std::string &key) const;
  JsonValue &operator[](const std::string &key);

  const JsonValue &operator[](size_t index) const;
  JsonValue &operator[](size_t index);
  size_t size() const;

  bool operator==(const JsonValue &other) const { return m_value == other.m_value; }
  bool operator!=(const JsonValue &other) const { return !(*this == other); }

  // Compact serialisation; object keys are emitted in sorted order
  std::string toString() const;

private:
  void writeToStream(std::ostream &stream) const;
};

/**
 * @brief Recursive-descent JSON parser producing a JsonValue tree.
 *
 * Game save files may start with a single comment line (a version marker
 * beginning with '#'); pass skipCommentLine to loadFromFile() to drop it.
 * Errors never throw: parse() and loadFromFile() return false and
 * getLastError() holds a "Line L, Column C: message" description.
 */
class JsonReader {
public:
  JsonReader();

  bool loadFromFile(const std::string &path, bool skipCommentLine = false);
  bool parse(const std::string &jsonString);

  const JsonValue &getRoot() const { return m_root; }
  JsonValue takeRoot() { return std::move(m_root); }
  const std::string &getLastError() const { return m_lastError; }
  void clearError() { m_lastError.clear(); }

  // Returns text with its first line removed when that line starts with '#'
  static std::string stripCommentLine(const std::string &text);

private:
  static constexpr size_t MAX_NESTING_DEPTH = 512;

  std::string m_input;
  size_t m_position;
  size_t m_line;
  size_t m_column;
  size_t m_depth;
  std::string m_lastError;
  JsonValue m_root;

  bool failed() const { return !m_lastError.empty(); }
  char peek(size_t offset = 0) const;
  char advance();
  void skipWhitespace();
  bool consumeLiteral(const char *literal);

  JsonValue parseValue();
  JsonValue parseObject();
  JsonValue parseArray();
  std::string parseString();
  JsonValue parseNumber();
  uint32_t parseHex4();
  static void appendUtf8(std::string &out, uint32_t codepoint);
  static bool isDigit(char c) { return c >= '0' && c <= '9'; }

  void setError(const std::string &message);
};

} // namespace OvermapAtlas

#endif // JSONREADER_HPP
