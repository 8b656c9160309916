/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"

#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <limits>
#include <ostream>
#include <sstream>
#include <string_view>

namespace KeeperEngine {

namespace {
constexpr int MAX_NESTING_DEPTH = 64;
}

std::ostream &operator<<(std::ostream &os, JsonType type) {
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

// ---------------------------------------------------------------------------
// JsonValue
// ---------------------------------------------------------------------------

JsonType JsonValue::getType() const {
  if (isBool()) return JsonType::Boolean;
  if (isNumber()) return JsonType::Number;
  if (isString()) return JsonType::String;
  if (isArray()) return JsonType::Array;
  if (isObject()) return JsonType::Object;
  return JsonType::Null;
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool()) return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber()) return asNumber();
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  if (!isNumber()) return std::nullopt;
  double value = asNumber();
  if (value != std::floor(value)) return std::nullopt;
  if (value < static_cast<double>(std::numeric_limits<int>::min()) ||
      value > static_cast<double>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString()) return asString();
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return std::get_if<JsonArray>(&m_value);
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  return find(key) != nullptr;
}

const JsonValue *JsonValue::find(const std::string &key) const {
  const JsonObject *object = tryAsObject();
  if (!object) return nullptr;
  auto it = object->find(key);
  return it == object->end() ? nullptr : &it->second;
}

size_t JsonValue::size() const {
  if (const JsonArray *array = tryAsArray()) return array->size();
  if (const JsonObject *object = tryAsObject()) return object->size();
  return 0;
}

// ---------------------------------------------------------------------------
// JsonReader
// ---------------------------------------------------------------------------

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Failed to open file: " + path;
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  skipWhitespace();
  if (atEnd()) {
    setError("Empty JSON input");
    return false;
  }

  auto value = parseValue(0);
  if (!value) {
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    setError(std::format("Unexpected trailing character '{}'", peek()));
    return false;
  }
  m_root = std::move(*value);
  return true;
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
  char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      break;
    }
    advance();
  }
}

void JsonReader::setError(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = std::format("{} at line {}, column {}", message, m_line, m_column);
  }
}

std::optional<JsonValue> JsonReader::parseValue(int depth) {
  if (depth > MAX_NESTING_DEPTH) {
    setError("Nesting too deep");
    return std::nullopt;
  }
  skipWhitespace();
  char c = peek();
  switch (c) {
  case '{':
    return parseObject(depth + 1);
  case '[':
    return parseArray(depth + 1);
  case '"': {
    auto text = parseString();
    if (!text) return std::nullopt;
    return JsonValue(std::move(*text));
  }
  case 't':
    if (parseLiteral("true")) return JsonValue(true);
    return std::nullopt;
  case 'f':
    if (parseLiteral("false")) return JsonValue(false);
    return std::nullopt;
  case 'n':
    if (parseLiteral("null")) return JsonValue();
    return std::nullopt;
  default:
    if (c == '-' || (c >= '0' && c <= '9')) {
      return parseNumber();
    }
    setError(atEnd() ? std::string("Unexpected end of input")
                     : std::format("Unexpected character '{}'", c));
    return std::nullopt;
  }
}

std::optional<JsonValue> JsonReader::parseObject(int depth) {
  advance(); // {
  JsonObject object;
  skipWhitespace();
  if (peek() == '}') {
    advance();
    return JsonValue(std::move(object));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      return std::nullopt;
    }
    auto key = parseString();
    if (!key) return std::nullopt;

    skipWhitespace();
    if (peek() != ':') {
      setError("Expected ':' after object key");
      return std::nullopt;
    }
    advance();

    auto value = parseValue(depth);
    if (!value) return std::nullopt;
    object[std::move(*key)] = std::move(*value);

    skipWhitespace();
    char c = peek();
    if (c == ',') {
      advance();
      continue;
    }
    if (c == '}') {
      advance();
      return JsonValue(std::move(object));
    }
    setError("Expected ',' or '}' in object");
    return std::nullopt;
  }
}

std::optional<JsonValue> JsonReader::parseArray(int depth) {
  advance(); // [
  JsonArray array;
  skipWhitespace();
  if (peek() == ']') {
    advance();
    return JsonValue(std::move(array));
  }

  while (true) {
    auto value = parseValue(depth);
    if (!value) return std::nullopt;
    array.push_back(std::move(*value));

    skipWhitespace();
    char c = peek();
    if (c == ',') {
      advance();
      continue;
    }
    if (c == ']') {
      advance();
      return JsonValue(std::move(array));
    }
    setError("Expected ',' or ']' in array");
    return std::nullopt;
  }
}

std::optional<std::string> JsonReader::parseString() {
  advance(); // opening quote
  std::string out;
  while (!atEnd()) {
    char c = advance();
    if (c == '"') {
      return out;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return std::nullopt;
    }
    if (c != '\\') {
      out.push_back(c);
      continue;
    }
    if (atEnd()) break;
    char escape = advance();
    switch (escape) {
    case '"':  out.push_back('"'); break;
    case '\\': out.push_back('\\'); break;
    case '/':  out.push_back('/'); break;
    case 'b':  out.push_back('\b'); break;
    case 'f':  out.push_back('\f'); break;
    case 'n':  out.push_back('\n'); break;
    case 'r':  out.push_back('\r'); break;
    case 't':  out.push_back('\t'); break;
    case 'u':
      if (!appendUnicodeEscape(out)) return std::nullopt;
      break;
    default:
      setError(std::format("Invalid escape sequence '\\{}'", escape));
      return std::nullopt;
    }
  }
  setError("Unterminated string");
  return std::nullopt;
}

bool JsonReader::appendUnicodeEscape(std::string &out) {
  if (m_position + 4 > m_input.size()) {
    setError("Truncated unicode escape");
    return false;
  }
  uint32_t code = 0;
  auto [ptr, ec] = std::from_chars(m_input.data() + m_position,
                                   m_input.data() + m_position + 4, code, 16);
  if (ec != std::errc() || ptr != m_input.data() + m_position + 4) {
    setError("Invalid unicode escape");
    return false;
  }
  for (int i = 0; i < 4; ++i) advance();

  // UTF-8 encode (surrogate pairs are passed through as individual code units)
  if (code < 0x80) {
    out.push_back(static_cast<char>(code));
  } else if (code < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
  return true;
}

std::optional<JsonValue> JsonReader::parseNumber() {
  size_t start = m_position;
  if (peek() == '-') advance();
  if (peek() == '0') {
    advance();
  } else if (peek() >= '1' && peek() <= '9') {
    while (peek() >= '0' && peek() <= '9') advance();
  } else {
    setError("Invalid number");
    return std::nullopt;
  }
  if (peek() == '.') {
    advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      setError("Expected digit after decimal point");
      return std::nullopt;
    }
    while (peek() >= '0' && peek() <= '9') advance();
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      setError("Expected digit in exponent");
      return std::nullopt;
    }
    while (peek() >= '0' && peek() <= '9') advance();
  }

  double value = 0.0;
  auto [ptr, ec] = std::from_chars(m_input.data() + start,
                                   m_input.data() + m_position, value);
  if (ec != std::errc()) {
    setError("Number out of range");
    return std::nullopt;
  }
  (void)ptr;
  return JsonValue(value);
}

bool JsonReader::parseLiteral(const char *literal) {
  std::string_view expected(literal);
  if (m_input.compare(m_position, expected.size(), expected) != 0) {
    setError("Invalid literal");
    return false;
  }
  for (size_t i = 0; i < expected.size(); ++i) advance();
  return true;
}

} // namespace KeeperEngine
