/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstring>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace OvermapAtlas {

namespace {

void writeEscaped(std::ostream &stream, const std::string &text) {
  stream << '"';
  for (char c : text) {
    switch (c) {
    case '"':
      stream << "\\\"";
      break;
    case '\\':
      stream << "\\\\";
      break;
    case '\n':
      stream << "\\n";
      break;
    case '\r':
      stream << "\\r";
      break;
    case '\t':
      stream << "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        stream << std::format("\\u{:04x}", static_cast<unsigned>(c));
      } else {
        stream << c;
      }
    }
  }
  stream << '"';
}

} // namespace

// JsonValue implementation
JsonType JsonValue::getType() const {
  switch (m_value.index()) {
  case 1:
    return JsonType::Boolean;
  case 2:
    return JsonType::Number;
  case 3:
    return JsonType::String;
  case 4:
    return JsonType::Array;
  case 5:
    return JsonType::Object;
  default:
    return JsonType::Null;
  }
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (isNumber())
    return asInt();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return std::get_if<JsonArray>(&m_value);
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  return obj != nullptr && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue null_value;
  const JsonObject *obj = tryAsObject();
  if (obj == nullptr)
    return null_value;
  auto it = obj->find(key);
  return (it != obj->end()) ? it->second : null_value;
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (!isObject()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue null_value;
  const JsonArray *arr = tryAsArray();
  if (arr == nullptr || index >= arr->size())
    return null_value;
  return (*arr)[index];
}

JsonValue &JsonValue::operator[](size_t index) {
  if (!isArray()) {
    m_value = JsonArray{};
  }
  auto &arr = asArray();
  if (index >= arr.size()) {
    arr.resize(index + 1);
  }
  return arr[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

std::string JsonValue::toString() const {
  std::ostringstream oss;
  writeToStream(oss);
  return oss.str();
}

void JsonValue::writeToStream(std::ostream &stream) const {
  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    double num = asNumber();
    if (std::floor(num) == num && std::abs(num) < 1e15) {
      stream << static_cast<long long>(num);
    } else {
      stream << num;
    }
    break;
  }
  case JsonType::String:
    writeEscaped(stream, asString());
    break;
  case JsonType::Array: {
    stream << '[';
    const auto &arr = asArray();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        stream << ',';
      arr[i].writeToStream(stream);
    }
    stream << ']';
    break;
  }
  case JsonType::Object: {
    // Sorted keys keep the output stable across hash orderings
    const auto &obj = asObject();
    std::vector<const JsonObject::value_type *> entries;
    entries.reserve(obj.size());
    for (const auto &entry : obj) {
      entries.push_back(&entry);
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto *a, const auto *b) { return a->first < b->first; });

    stream << '{';
    bool first = true;
    for (const auto *entry : entries) {
      if (!first)
        stream << ',';
      first = false;
      writeEscaped(stream, entry->first);
      stream << ':';
      entry->second.writeToStream(stream);
    }
    stream << '}';
    break;
  }
  }
}

// JsonReader implementation
JsonReader::JsonReader() : m_position(0), m_line(1), m_column(1), m_depth(0) {}

std::string JsonReader::stripCommentLine(const std::string &text) {
  if (text.empty() || text.front() != '#') {
    return text;
  }
  size_t newline = text.find('\n');
  if (newline == std::string::npos) {
    return std::string();
  }
  return text.substr(newline + 1);
}

bool JsonReader::loadFromFile(const std::string &path, bool skipCommentLine) {
  clearError();
  m_line = 1;
  m_column = 1;

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    setError("Could not open file: " + path);
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    setError("Read error on file: " + path);
    return false;
  }

  if (skipCommentLine) {
    return parse(stripCommentLine(buffer.str()));
  }
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_depth = 0;
  m_root = JsonValue();

  // Tolerate a UTF-8 byte order mark
  if (m_input.size() >= 3 && static_cast<unsigned char>(m_input[0]) == 0xEF &&
      static_cast<unsigned char>(m_input[1]) == 0xBB &&
      static_cast<unsigned char>(m_input[2]) == 0xBF) {
    m_position = 3;
  }

  skipWhitespace();
  if (m_position >= m_input.length()) {
    setError("Empty JSON input");
    return false;
  }

  JsonValue result = parseValue();
  if (failed()) {
    return false;
  }

  skipWhitespace();
  if (m_position < m_input.length()) {
    setError("Unexpected token after JSON value");
    return false;
  }

  m_root = std::move(result);
  return true;
}

void JsonReader::setError(const std::string &message) {
  // Keep the first error; later ones are consequences of it
  if (failed()) {
    return;
  }
  m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
}

char JsonReader::peek(size_t offset) const {
  size_t pos = m_position + offset;
  return (pos < m_input.length()) ? m_input[pos] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.length())
    return '\0';

  char c = m_input[m_position++];
  if (c == '\n') {
    m_line++;
    m_column = 1;
  } else {
    m_column++;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (m_position < m_input.length()) {
    char c = peek();
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
      advance();
    } else {
      break;
    }
  }
}

bool JsonReader::consumeLiteral(const char *literal) {
  size_t length = std::strlen(literal);
  if (m_input.compare(m_position, length, literal) != 0) {
    return false;
  }
  m_position += length;
  m_column += length;
  return true;
}

JsonValue JsonReader::parseValue() {
  skipWhitespace();
  char c = peek();

  switch (c) {
  case '{':
    return parseObject();
  case '[':
    return parseArray();
  case '"':
    return JsonValue(parseString());
  case 't':
    if (consumeLiteral("true"))
      return JsonValue(true);
    break;
  case 'f':
    if (consumeLiteral("false"))
      return JsonValue(false);
    break;
  case 'n':
    if (consumeLiteral("null"))
      return JsonValue();
    break;
  case '\0':
    if (m_position >= m_input.length()) {
      setError("Unexpected end of input");
      return JsonValue();
    }
    break;
  default:
    if (isDigit(c) || c == '-') {
      return parseNumber();
    }
    break;
  }

  setError("Unexpected character: " + std::string(1, c));
  return JsonValue();
}

JsonValue JsonReader::parseObject() {
  if (++m_depth > MAX_NESTING_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return JsonValue();
  }

  JsonObject result;
  advance(); // '{'
  skipWhitespace();

  if (peek() == '}') {
    advance();
    --m_depth;
    return JsonValue(std::move(result));
  }

  while (!failed()) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      break;
    }
    std::string key = parseString();
    if (failed())
      break;

    skipWhitespace();
    if (peek() != ':') {
      setError("Expected ':' after object key");
      break;
    }
    advance();

    JsonValue value = parseValue();
    if (failed())
      break;
    // Duplicate keys: the last occurrence wins
    result.insert_or_assign(std::move(key), std::move(value));

    skipWhitespace();
    char next = peek();
    if (next == ',') {
      advance();
      continue;
    }
    if (next == '}') {
      advance();
      break;
    }
    setError("Expected '}' or ',' in object");
  }

  --m_depth;
  return JsonValue(std::move(result));
}

JsonValue JsonReader::parseArray() {
  if (++m_depth > MAX_NESTING_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return JsonValue();
  }

  JsonArray result;
  advance(); // '['
  skipWhitespace();

  if (peek() == ']') {
    advance();
    --m_depth;
    return JsonValue(std::move(result));
  }

  while (!failed()) {
    JsonValue value = parseValue();
    if (failed())
      break;
    result.push_back(std::move(value));

    skipWhitespace();
    char next = peek();
    if (next == ',') {
      advance();
      continue;
    }
    if (next == ']') {
      advance();
      break;
    }
    setError("Expected ']' or ',' in array");
  }

  --m_depth;
  return JsonValue(std::move(result));
}

std::string JsonReader::parseString() {
  advance(); // opening quote

  std::string result;
  while (m_position < m_input.length()) {
    char c = advance();

    if (c == '"') {
      return result;
    }

    if (c == '\\') {
      char escaped = advance();
      switch (escaped) {
      case '"':
      case '\\':
      case '/':
        result += escaped;
        break;
      case 'b':
        result += '\b';
        break;
      case 'f':
        result += '\f';
        break;
      case 'n':
        result += '\n';
        break;
      case 'r':
        result += '\r';
        break;
      case 't':
        result += '\t';
        break;
      case 'u': {
        uint32_t codepoint = parseHex4();
        if (failed())
          return std::string();

        // Combine UTF-16 surrogate pairs
        if (codepoint >= 0xD800 && codepoint <= 0xDBFF && peek() == '\\' &&
            peek(1) == 'u') {
          advance();
          advance();
          uint32_t low = parseHex4();
          if (failed())
            return std::string();
          if (low >= 0xDC00 && low <= 0xDFFF) {
            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
          } else {
            appendUtf8(result, codepoint);
            codepoint = low;
          }
        }
        appendUtf8(result, codepoint);
        break;
      }
      case '\0':
        setError("Unexpected end of input in string escape");
        return std::string();
      default:
        setError("Invalid escape sequence: \\" + std::string(1, escaped));
        return std::string();
      }
    } else if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return std::string();
    } else {
      result += c;
    }
  }

  setError("Unterminated string");
  return std::string();
}

JsonValue JsonReader::parseNumber() {
  size_t start = m_position;

  if (peek() == '-') {
    advance();
  }

  if (peek() == '0') {
    advance();
  } else if (isDigit(peek())) {
    while (isDigit(peek())) {
      advance();
    }
  } else {
    setError("Invalid number format");
    return JsonValue();
  }

  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      setError("Invalid number format: expected digit after decimal point");
      return JsonValue();
    }
    while (isDigit(peek())) {
      advance();
    }
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (!isDigit(peek())) {
      setError("Invalid number format: expected digit in exponent");
      return JsonValue();
    }
    while (isDigit(peek())) {
      advance();
    }
  }

  std::string numStr = m_input.substr(start, m_position - start);
  try {
    return JsonValue(std::stod(numStr));
  } catch (const std::out_of_range &) {
    setError("Number out of range: " + numStr);
  } catch (const std::invalid_argument &) {
    setError("Invalid number format: " + numStr);
  }
  return JsonValue();
}

uint32_t JsonReader::parseHex4() {
  if (m_position + 4 > m_input.length()) {
    setError("Invalid Unicode escape sequence");
    return 0;
  }

  uint32_t result = 0;
  const char *first = m_input.data() + m_position;
  auto [ptr, ec] = std::from_chars(first, first + 4, result, 16);
  if (ec != std::errc() || ptr != first + 4) {
    setError("Invalid Unicode escape sequence");
    return 0;
  }
  m_position += 4;
  m_column += 4;
  return result;
}

void JsonReader::appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint <= 0x7F) {
    out += static_cast<char>(codepoint);
  } else if (codepoint <= 0x7FF) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint <= 0xFFFF) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}

} // namespace OvermapAtlas
