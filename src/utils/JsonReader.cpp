/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"

#include <cstdlib>
#include <cstring>
#include <format>
#include <fstream>
#include <sstream>

namespace Ironclad {

namespace {
const JsonValue kNullValue{};
} // anonymous namespace

std::optional<double> JsonValue::tryAsNumber() const {
  if (const double *number = std::get_if<double>(&m_value)) {
    return *number;
  }
  return std::nullopt;
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *object = tryAsObject();
  return object != nullptr && object->find(key) != object->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonObject *object = tryAsObject();
  if (object == nullptr) {
    return kNullValue;
  }
  auto it = object->find(key);
  return it == object->end() ? kNullValue : it->second;
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const JsonArray *array = tryAsArray();
  if (array == nullptr || index >= array->size()) {
    return kNullValue;
  }
  return (*array)[index];
}

size_t JsonValue::size() const {
  if (const JsonArray *array = tryAsArray()) {
    return array->size();
  }
  if (const JsonObject *object = tryAsObject()) {
    return object->size();
  }
  return 0;
}

// ============================================================================
// JsonReader
// ============================================================================

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Cannot open file: " + path;
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
  m_depth = 0;
  m_lastError.clear();
  m_root = JsonValue();

  JsonValue root;
  if (!parseValue(root)) {
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    return fail("Unexpected trailing characters");
  }

  m_root = std::move(root);
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
      return;
    }
    advance();
  }
}

bool JsonReader::expect(char c) {
  skipWhitespace();
  if (peek() != c) {
    return fail(std::string("Expected '") + c + "'");
  }
  advance();
  return true;
}

bool JsonReader::fail(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = std::format("line {}, column {}: {}", m_line, m_column, message);
  }
  return false;
}

bool JsonReader::parseValue(JsonValue &out) {
  skipWhitespace();
  if (atEnd()) {
    return fail("Unexpected end of input");
  }

  switch (peek()) {
  case '{':
    return parseObject(out);
  case '[':
    return parseArray(out);
  case '"': {
    std::string text;
    if (!parseString(text)) {
      return false;
    }
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(), out);
  default:
    return parseNumber(out);
  }
}

bool JsonReader::parseObject(JsonValue &out) {
  if (++m_depth > MAX_DEPTH) {
    return fail("Nesting too deep");
  }
  advance(); // '{'

  JsonObject object;
  skipWhitespace();
  if (peek() == '}') {
    advance();
  } else {
    while (true) {
      skipWhitespace();
      if (peek() != '"') {
        return fail("Expected string key");
      }
      std::string key;
      if (!parseString(key) || !expect(':')) {
        return false;
      }

      JsonValue value;
      if (!parseValue(value)) {
        return false;
      }
      object[std::move(key)] = std::move(value);

      skipWhitespace();
      if (peek() == ',') {
        advance();
        continue;
      }
      if (!expect('}')) {
        return false;
      }
      break;
    }
  }

  --m_depth;
  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out) {
  if (++m_depth > MAX_DEPTH) {
    return fail("Nesting too deep");
  }
  advance(); // '['

  JsonArray array;
  skipWhitespace();
  if (peek() == ']') {
    advance();
  } else {
    while (true) {
      JsonValue element;
      if (!parseValue(element)) {
        return false;
      }
      array.push_back(std::move(element));

      skipWhitespace();
      if (peek() == ',') {
        advance();
        continue;
      }
      if (!expect(']')) {
        return false;
      }
      break;
    }
  }

  --m_depth;
  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  while (true) {
    if (atEnd()) {
      return fail("Unterminated string");
    }
    char c = advance();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Control character in string");
    }
    if (c != '\\') {
      out.push_back(c);
      continue;
    }

    if (atEnd()) {
      return fail("Unterminated escape sequence");
    }
    char escaped = advance();
    switch (escaped) {
    case '"': out.push_back('"'); break;
    case '\\': out.push_back('\\'); break;
    case '/': out.push_back('/'); break;
    case 'b': out.push_back('\b'); break;
    case 'f': out.push_back('\f'); break;
    case 'n': out.push_back('\n'); break;
    case 'r': out.push_back('\r'); break;
    case 't': out.push_back('\t'); break;
    case 'u':
      if (!parseUnicodeEscape(out)) {
        return false;
      }
      break;
    default:
      return fail(std::string("Invalid escape '\\") + escaped + "'");
    }
  }
}

bool JsonReader::parseUnicodeEscape(std::string &out) {
  uint32_t codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    if (atEnd()) {
      return fail("Truncated unicode escape");
    }
    char h = advance();
    codepoint <<= 4;
    if (h >= '0' && h <= '9') {
      codepoint |= static_cast<uint32_t>(h - '0');
    } else if (h >= 'a' && h <= 'f') {
      codepoint |= static_cast<uint32_t>(h - 'a' + 10);
    } else if (h >= 'A' && h <= 'F') {
      codepoint |= static_cast<uint32_t>(h - 'A' + 10);
    } else {
      return fail("Invalid hex digit in unicode escape");
    }
  }

  // UTF-8 encode (BMP only)
  if (codepoint < 0x80) {
    out.push_back(static_cast<char>(codepoint));
  } else if (codepoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;
  auto digits = [this]() {
    size_t count = 0;
    while (!atEnd() && peek() >= '0' && peek() <= '9') {
      advance();
      ++count;
    }
    return count;
  };

  if (peek() == '-') {
    advance();
  }
  if (digits() == 0) {
    return fail("Invalid value");
  }
  if (peek() == '.') {
    advance();
    if (digits() == 0) {
      return fail("Expected digits after decimal point");
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (digits() == 0) {
      return fail("Expected exponent digits");
    }
  }

  const std::string text = m_input.substr(start, m_position - start);
  out = JsonValue(std::strtod(text.c_str(), nullptr));
  return true;
}

bool JsonReader::parseLiteral(const char *word, JsonValue value, JsonValue &out) {
  const size_t length = std::strlen(word);
  if (m_input.compare(m_position, length, word) != 0) {
    return fail("Invalid literal");
  }
  for (size_t i = 0; i < length; ++i) {
    advance();
  }
  out = std::move(value);
  return true;
}

} // namespace Ironclad
