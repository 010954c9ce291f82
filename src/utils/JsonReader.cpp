/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <locale>
#include <ostream>
#include <sstream>

namespace SoloAdventure {

namespace {
constexpr int MAX_DEPTH = 64;

const JsonValue &nullValue() {
  static const JsonValue value;
  return value;
}

void writeEscaped(std::string &out, const std::string &text) {
  out += '"';
  for (unsigned char c : text) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
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
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    default:
      if (c < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", c);
        out += buffer;
      } else {
        out += static_cast<char>(c);
      }
    }
  }
  out += '"';
}

void writeNumber(std::string &out, double value) {
  if (!std::isfinite(value)) {
    out += "null";
    return;
  }
  double whole = 0.0;
  if (std::modf(value, &whole) == 0.0 && std::fabs(value) < 1e15) {
    out += std::to_string(static_cast<long long>(value));
    return;
  }
  std::ostringstream stream;
  stream.precision(17);
  stream << value;
  out += stream.str();
}
} // namespace

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

JsonType JsonValue::getType() const {
  return static_cast<JsonType>(m_value.index());
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
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
  return obj && obj->find(key) != obj->end();
}

std::string JsonValue::getString(const std::string &key,
                                 const std::string &fallback) const {
  const JsonValue &value = (*this)[key];
  return value.isString() ? value.asString() : fallback;
}

int JsonValue::getInt(const std::string &key, int fallback) const {
  const JsonValue &value = (*this)[key];
  return value.isNumber() ? value.asInt() : fallback;
}

bool JsonValue::getBool(const std::string &key, bool fallback) const {
  const JsonValue &value = (*this)[key];
  return value.isBool() ? value.asBool() : fallback;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  if (!obj)
    return nullValue();
  auto it = obj->find(key);
  return it != obj->end() ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const JsonArray *arr = tryAsArray();
  if (!arr || index >= arr->size())
    return nullValue();
  return (*arr)[index];
}

JsonValue &JsonValue::set(const std::string &key, JsonValue value) {
  if (isNull())
    m_value = JsonObject{};
  JsonValue &slot = asObject()[key];
  slot = std::move(value);
  return slot;
}

JsonValue &JsonValue::push(JsonValue value) {
  if (isNull())
    m_value = JsonArray{};
  JsonArray &arr = asArray();
  arr.push_back(std::move(value));
  return arr.back();
}

size_t JsonValue::size() const {
  if (const JsonArray *arr = tryAsArray())
    return arr->size();
  if (const JsonObject *obj = tryAsObject())
    return obj->size();
  return 0;
}

std::string JsonValue::toString(int indent) const {
  std::string out;
  write(out, indent, 0);
  return out;
}

void JsonValue::write(std::string &out, int indent, int depth) const {
  auto newline = [&](int level) {
    if (indent > 0) {
      out += '\n';
      out.append(static_cast<size_t>(indent * level), ' ');
    }
  };

  switch (getType()) {
  case JsonType::Null:
    out += "null";
    break;
  case JsonType::Boolean:
    out += asBool() ? "true" : "false";
    break;
  case JsonType::Number:
    writeNumber(out, asNumber());
    break;
  case JsonType::String:
    writeEscaped(out, asString());
    break;
  case JsonType::Array: {
    const JsonArray &arr = asArray();
    if (arr.empty()) {
      out += "[]";
      break;
    }
    out += '[';
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        out += ',';
      newline(depth + 1);
      arr[i].write(out, indent, depth + 1);
    }
    newline(depth);
    out += ']';
    break;
  }
  case JsonType::Object: {
    const JsonObject &obj = asObject();
    if (obj.empty()) {
      out += "{}";
      break;
    }
    out += '{';
    bool first = true;
    for (const auto &[key, value] : obj) {
      if (!first)
        out += ',';
      first = false;
      newline(depth + 1);
      writeEscaped(out, key);
      out += indent > 0 ? ": " : ":";
      value.write(out, indent, depth + 1);
    }
    newline(depth);
    out += '}';
    break;
  }
  }
}

// JsonReader

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    m_lastError = "Failed reading file: " + path;
    return false;
  }
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_failed = false;
  m_lastError.clear();
  m_root = JsonValue();

  skipWhitespace();
  JsonValue root = parseValue(0);
  if (m_failed)
    return false;

  skipWhitespace();
  if (m_position < m_input.size())
    return fail("Unexpected trailing content");

  m_root = std::move(root);
  return true;
}

char JsonReader::peek() const {
  return m_position < m_input.size() ? m_input[m_position] : '\0';
}

char JsonReader::next() {
  if (m_position >= m_input.size())
    return '\0';
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
  while (m_position < m_input.size()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      break;
    next();
  }
}

bool JsonReader::fail(const std::string &message) {
  if (!m_failed) {
    m_failed = true;
    m_lastError = message + " at line " + std::to_string(m_line) +
                  ", column " + std::to_string(m_column);
  }
  return false;
}

JsonValue JsonReader::parseValue(int depth) {
  if (depth > MAX_DEPTH) {
    fail("Document nested too deeply");
    return JsonValue();
  }

  switch (peek()) {
  case '{':
    return parseObject(depth);
  case '[':
    return parseArray(depth);
  case '"':
    return JsonValue(parseString());
  case 't':
    return parseLiteral("true") ? JsonValue(true) : JsonValue();
  case 'f':
    return parseLiteral("false") ? JsonValue(false) : JsonValue();
  case 'n':
    parseLiteral("null");
    return JsonValue();
  case '\0':
    fail("Unexpected end of input");
    return JsonValue();
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9'))
      return parseNumber();
    fail(std::string("Unexpected character '") + peek() + "'");
    return JsonValue();
  }
}

JsonValue JsonReader::parseObject(int depth) {
  next(); // {
  JsonObject object;
  skipWhitespace();
  if (peek() == '}') {
    next();
    return JsonValue(std::move(object));
  }

  while (!m_failed) {
    skipWhitespace();
    if (peek() != '"') {
      fail("Expected string key");
      break;
    }
    std::string key = parseString();
    skipWhitespace();
    if (next() != ':') {
      fail("Expected ':' after key \"" + key + "\"");
      break;
    }
    skipWhitespace();
    JsonValue value = parseValue(depth + 1);
    if (m_failed)
      break;
    object[key] = std::move(value);

    skipWhitespace();
    char c = next();
    if (c == '}')
      return JsonValue(std::move(object));
    if (c != ',')
      fail("Expected ',' or '}' in object");
  }
  return JsonValue();
}

JsonValue JsonReader::parseArray(int depth) {
  next(); // [
  JsonArray array;
  skipWhitespace();
  if (peek() == ']') {
    next();
    return JsonValue(std::move(array));
  }

  while (!m_failed) {
    skipWhitespace();
    JsonValue value = parseValue(depth + 1);
    if (m_failed)
      break;
    array.push_back(std::move(value));

    skipWhitespace();
    char c = next();
    if (c == ']')
      return JsonValue(std::move(array));
    if (c != ',')
      fail("Expected ',' or ']' in array");
  }
  return JsonValue();
}

std::string JsonReader::parseString() {
  next(); // opening quote
  std::string out;
  while (!m_failed) {
    char c = next();
    if (c == '\0' && m_position >= m_input.size()) {
      fail("Unterminated string");
      break;
    }
    if (c == '"')
      return out;
    if (static_cast<unsigned char>(c) < 0x20) {
      fail("Control character in string");
      break;
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    char escape = next();
    switch (escape) {
    case '"':
    case '\\':
    case '/':
      out += escape;
      break;
    case 'b':
      out += '\b';
      break;
    case 'f':
      out += '\f';
      break;
    case 'n':
      out += '\n';
      break;
    case 'r':
      out += '\r';
      break;
    case 't':
      out += '\t';
      break;
    case 'u': {
      uint32_t codepoint = parseHex4();
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF && peek() == '\\') {
        next();
        if (next() != 'u') {
          fail("Invalid surrogate pair");
          break;
        }
        uint32_t low = parseHex4();
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(out, codepoint);
      break;
    }
    default:
      fail(std::string("Invalid escape '\\") + escape + "'");
    }
  }
  return std::string();
}

uint32_t JsonReader::parseHex4() {
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    char c = next();
    value <<= 4;
    if (c >= '0' && c <= '9')
      value |= static_cast<uint32_t>(c - '0');
    else if (c >= 'a' && c <= 'f')
      value |= static_cast<uint32_t>(c - 'a' + 10);
    else if (c >= 'A' && c <= 'F')
      value |= static_cast<uint32_t>(c - 'A' + 10);
    else {
      fail("Invalid unicode escape");
      return 0;
    }
  }
  return value;
}

void JsonReader::appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint < 0x10000) {
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

JsonValue JsonReader::parseNumber() {
  size_t start = m_position;
  if (peek() == '-')
    next();
  auto digits = [this]() {
    size_t count = 0;
    while (peek() >= '0' && peek() <= '9') {
      next();
      ++count;
    }
    return count;
  };
  if (digits() == 0) {
    fail("Invalid number");
    return JsonValue();
  }
  if (peek() == '.') {
    next();
    if (digits() == 0) {
      fail("Invalid number fraction");
      return JsonValue();
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    next();
    if (peek() == '+' || peek() == '-')
      next();
    if (digits() == 0) {
      fail("Invalid number exponent");
      return JsonValue();
    }
  }

  std::istringstream stream(m_input.substr(start, m_position - start));
  stream.imbue(std::locale::classic());
  double value = 0.0;
  stream >> value;
  return JsonValue(value);
}

bool JsonReader::parseLiteral(const char *word) {
  for (const char *c = word; *c; ++c) {
    if (next() != *c)
      return fail(std::string("Invalid literal, expected ") + word);
  }
  return true;
}

bool writeJsonFile(const std::string &path, const JsonValue &value,
                   std::string *error) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::path target(path);
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      if (error)
        *error = "Could not create directory " +
                 target.parent_path().string() + ": " + ec.message();
      return false;
    }
  }

  // Write next to the target, then swap, so a crash never leaves half a file
  fs::path temp = target;
  temp += ".tmp";
  {
    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      if (error)
        *error = "Could not open " + temp.string() + " for writing";
      return false;
    }
    file << value.toString(2) << '\n';
    if (!file.good()) {
      if (error)
        *error = "Failed writing " + temp.string();
      return false;
    }
  }

  fs::rename(temp, target, ec);
  if (ec) {
    if (error)
      *error = "Could not replace " + target.string() + ": " + ec.message();
    fs::remove(temp, ec);
    return false;
  }
  return true;
}

} // namespace SoloAdventure
