/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace SoloAdventure {

class JsonValue;

// Ordered map so written documents are stable between runs (save files, roster)
using JsonObject = std::map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

enum class JsonType { Null, Boolean, Number, String, Array, Object };

// Stream operator for JsonType (for Boost.Test)
std::ostream &operator<<(std::ostream &os, JsonType type);

class JsonValue {
public:
  using ValueType = std::variant<std::nullptr_t, bool, double, std::string,
                                 JsonArray, JsonObject>;

  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(std::nullptr_t) : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(int value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(const std::string &value) : m_value(value) {}
  explicit JsonValue(std::string &&value) : m_value(std::move(value)) {}
  explicit JsonValue(const char *value) : m_value(std::string(value)) {}
  explicit JsonValue(JsonArray value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonObject value) : m_value(std::move(value)) {}

  JsonType getType() const;
  bool isNull() const { return std::holds_alternative<std::nullptr_t>(m_value); }
  bool isBool() const { return std::holds_alternative<bool>(m_value); }
  bool isNumber() const { return std::holds_alternative<double>(m_value); }
  bool isString() const { return std::holds_alternative<std::string>(m_value); }
  bool isArray() const { return std::holds_alternative<JsonArray>(m_value); }
  bool isObject() const { return std::holds_alternative<JsonObject>(m_value); }

  // Value accessors (throw std::bad_variant_access if wrong type)
  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  int asInt() const { return static_cast<int>(std::get<double>(m_value)); }
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }
  JsonArray &asArray() { return std::get<JsonArray>(m_value); }
  JsonObject &asObject() { return std::get<JsonObject>(m_value); }

  // Safe accessors
  std::optional<bool> tryAsBool() const;
  std::optional<int> tryAsInt() const;
  std::optional<std::string> tryAsString() const;
  const JsonArray *tryAsArray() const;
  const JsonObject *tryAsObject() const;

  // Member lookups with fallbacks, used by every loader in the project.
  // A missing key or a value of the wrong type yields the fallback.
  bool hasKey(const std::string &key) const;
  std::string getString(const std::string &key,
                        const std::string &fallback = "") const;
  int getInt(const std::string &key, int fallback = 0) const;
  bool getBool(const std::string &key, bool fallback = false) const;

  // Missing keys and out of range indices resolve to a shared null value
  const JsonValue &operator[](const std::string &key) const;
  const JsonValue &operator[](size_t index) const;

  // Turns a null value into an object on first use
  JsonValue &set(const std::string &key, JsonValue value);
  // Turns a null value into an array on first use
  JsonValue &push(JsonValue value);

  size_t size() const;

  // Serialize; indent > 0 pretty prints with that many spaces per level
  std::string toString(int indent = 0) const;

private:
  void write(std::string &out, int indent, int depth) const;

  ValueType m_value;
};

class JsonReader {
public:
  JsonReader() = default;

  bool loadFromFile(const std::string &path);
  bool parse(const std::string &jsonString);
  const JsonValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }
  void clearError() { m_lastError.clear(); }

private:
  JsonValue parseValue(int depth);
  JsonValue parseObject(int depth);
  JsonValue parseArray(int depth);
  std::string parseString();
  JsonValue parseNumber();
  bool parseLiteral(const char *word);
  void appendUtf8(std::string &out, uint32_t codepoint);
  uint32_t parseHex4();

  char peek() const;
  char next();
  void skipWhitespace();
  bool fail(const std::string &message);

  std::string m_input;
  size_t m_position{0};
  size_t m_line{1};
  size_t m_column{1};
  bool m_failed{false};
  std::string m_lastError;
  JsonValue m_root;
};

// Write a value to disk, pretty printed. Returns false on I/O failure.
bool writeJsonFile(const std::string &path, const JsonValue &value,
                   std::string *error = nullptr);

} // namespace SoloAdventure

#endif // JSONREADER_HPP
