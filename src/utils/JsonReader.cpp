/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <cstdio>
#include <format>
#include <fstream>
#include <sstream>

namespace LatticeMint {

namespace {
const JsonValue &nullValue() {
  static const JsonValue instance;
  return instance;
}

void writeEscaped(std::string &out, const std::string &text) {
  out.push_back('"');
  for (char c : text) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                      static_cast<unsigned int>(c));
        out += buffer;
      } else {
        out.push_back(c);
      }
    }
  }
  out.push_back('"');
}
} // namespace

// JsonValue implementation

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

std::optional<uint64_t> JsonValue::tryAsUnsigned() const {
  if (!isNumber())
    return std::nullopt;
  double number = asNumber();
  // 2^64 is exactly representable; anything at or above it does not fit
  if (number < 0.0 || number >= 18446744073709551616.0 ||
      std::floor(number) != number)
    return std::nullopt;
  return static_cast<uint64_t>(number);
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

bool JsonValue::hasKey(const std::string &key) const {
  if (!isObject())
    return false;
  return asObject().count(key) > 0;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  if (!isObject())
    return nullValue();
  const auto &object = asObject();
  auto it = object.find(key);
  return it == object.end() ? nullValue() : it->second;
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (isNull())
    m_value = JsonObject{};
  return asObject()[key];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

std::string JsonValue::toString() const {
  std::string out;
  writeTo(out);
  return out;
}

void JsonValue::writeTo(std::string &out) const {
  switch (getType()) {
  case JsonType::Null:
    out += "null";
    break;
  case JsonType::Boolean:
    out += asBool() ? "true" : "false";
    break;
  case JsonType::Number: {
    double number = asNumber();
    if (std::isfinite(number) && std::floor(number) == number &&
        std::fabs(number) < 9007199254740992.0) {
      out += std::to_string(static_cast<int64_t>(number));
    } else if (std::isfinite(number)) {
      out += std::format("{}", number);
    } else {
      out += "null"; // JSON has no NaN/Inf
    }
    break;
  }
  case JsonType::String:
    writeEscaped(out, asString());
    break;
  case JsonType::Array: {
    out.push_back('[');
    bool first = true;
    for (const auto &element : asArray()) {
      if (!first)
        out.push_back(',');
      first = false;
      element.writeTo(out);
    }
    out.push_back(']');
    break;
  }
  case JsonType::Object: {
    out.push_back('{');
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first)
        out.push_back(',');
      first = false;
      writeEscaped(out, key);
      out.push_back(':');
      value.writeTo(out);
    }
    out.push_back('}');
    break;
  }
  }
}

// JsonReader implementation

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_root = JsonValue();
    m_lastError = "Could not open file: " + path;
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

  JsonValue root;
  skipWhitespace();
  if (!parseValue(root, 0)) {
    m_root = JsonValue();
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    m_root = JsonValue();
    return fail("Unexpected trailing characters");
  }

  m_root = std::move(root);
  return true;
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
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      break;
    advance();
  }
}

bool JsonReader::fail(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError =
        std::format("{} at line {}, column {}", message, m_line, m_column);
  }
  return false;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH)
    return fail("Maximum nesting depth exceeded");

  switch (peek()) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string text;
    if (!parseString(text))
      return false;
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(nullptr), out);
  case '\0':
    if (atEnd())
      return fail("Unexpected end of input");
    return fail("Unexpected character");
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9'))
      return parseNumber(out);
    return fail(std::format("Unexpected character '{}'", peek()));
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // '{'
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"')
      return fail("Expected string key in object");

    std::string key;
    if (!parseString(key))
      return false;

    skipWhitespace();
    if (peek() != ':')
      return fail("Expected ':' after object key");
    advance();

    skipWhitespace();
    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    object[key] = std::move(value);

    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (peek() == '}') {
      advance();
      break;
    }
    return fail("Expected ',' or '}' in object");
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // '['
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    skipWhitespace();
    JsonValue element;
    if (!parseValue(element, depth))
      return false;
    array.push_back(std::move(element));

    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (peek() == ']') {
      advance();
      break;
    }
    return fail("Expected ',' or ']' in array");
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (true) {
    if (atEnd())
      return fail("Unterminated string");

    char c = advance();
    if (c == '"')
      return true;
    if (static_cast<unsigned char>(c) < 0x20)
      return fail("Control character in string");
    if (c != '\\') {
      out.push_back(c);
      continue;
    }

    if (atEnd())
      return fail("Unterminated escape sequence");
    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      out.push_back(escaped);
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
      uint32_t codePoint = 0;
      if (!parseUnicodeEscape(codePoint))
        return false;
      // Surrogate pair
      if (codePoint >= 0xD800 && codePoint <= 0xDBFF) {
        if (peek() != '\\')
          return fail("Unpaired high surrogate");
        advance();
        if (peek() != 'u')
          return fail("Unpaired high surrogate");
        advance();
        uint32_t low = 0;
        if (!parseUnicodeEscape(low))
          return false;
        if (low < 0xDC00 || low > 0xDFFF)
          return fail("Invalid low surrogate");
        codePoint = 0x10000 + ((codePoint - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(out, codePoint);
      break;
    }
    default:
      return fail(std::format("Invalid escape character '{}'", escaped));
    }
  }
}

bool JsonReader::parseUnicodeEscape(uint32_t &codePoint) {
  codePoint = 0;
  for (int i = 0; i < 4; ++i) {
    if (atEnd())
      return fail("Truncated unicode escape");
    char c = advance();
    codePoint <<= 4;
    if (c >= '0' && c <= '9')
      codePoint |= static_cast<uint32_t>(c - '0');
    else if (c >= 'a' && c <= 'f')
      codePoint |= static_cast<uint32_t>(c - 'a' + 10);
    else if (c >= 'A' && c <= 'F')
      codePoint |= static_cast<uint32_t>(c - 'A' + 10);
    else
      return fail("Invalid hex digit in unicode escape");
  }
  return true;
}

void JsonReader::appendUtf8(std::string &out, uint32_t codePoint) const {
  if (codePoint < 0x80) {
    out.push_back(static_cast<char>(codePoint));
  } else if (codePoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else if (codePoint < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  }
}

bool JsonReader::parseNumber(JsonValue &out) {
  size_t start = m_position;

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (peek() >= '1' && peek() <= '9') {
    while (peek() >= '0' && peek() <= '9')
      advance();
  } else {
    return fail("Invalid number");
  }

  if (peek() == '.') {
    advance();
    if (!(peek() >= '0' && peek() <= '9'))
      return fail("Expected digit after decimal point");
    while (peek() >= '0' && peek() <= '9')
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!(peek() >= '0' && peek() <= '9'))
      return fail("Expected digit in exponent");
    while (peek() >= '0' && peek() <= '9')
      advance();
  }

  double number = 0.0;
  const char *first = m_input.data() + start;
  const char *last = m_input.data() + m_position;
  auto [ptr, ec] = std::from_chars(first, last, number);
  if (ec != std::errc() || ptr != last)
    return fail("Number out of range");

  out = JsonValue(number);
  return true;
}

bool JsonReader::parseLiteral(const char *literal, JsonValue value,
                              JsonValue &out) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (atEnd() || peek() != *p)
      return fail(std::format("Invalid literal, expected '{}'", literal));
    advance();
  }
  out = std::move(value);
  return true;
}

} // namespace LatticeMint
