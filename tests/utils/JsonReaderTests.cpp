/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE JsonReaderTests
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>

using namespace SoloAdventure;

namespace {
const std::string TEST_DIR = "tests/test_data/json";
}

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  // Null
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);
  BOOST_CHECK_EQUAL(nullVal.toString(), "null");

  // Boolean
  JsonValue trueVal(true);
  JsonValue falseVal(false);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.asBool(), true);
  BOOST_CHECK_EQUAL(falseVal.asBool(), false);
  BOOST_CHECK_EQUAL(trueVal.toString(), "true");
  BOOST_CHECK_EQUAL(falseVal.toString(), "false");

  // Number
  JsonValue intVal(42);
  JsonValue doubleVal(3.14);
  BOOST_CHECK(intVal.isNumber());
  BOOST_CHECK_EQUAL(intVal.asInt(), 42);
  BOOST_CHECK_EQUAL(intVal.toString(), "42");
  BOOST_CHECK_CLOSE(doubleVal.asNumber(), 3.14, 0.001);

  // String
  JsonValue stringVal("hello");
  BOOST_CHECK(stringVal.isString());
  BOOST_CHECK_EQUAL(stringVal.asString(), "hello");
  BOOST_CHECK_EQUAL(stringVal.toString(), "\"hello\"");
}

BOOST_AUTO_TEST_CASE(TestArrayOperations) {
  JsonArray arr;
  arr.push_back(JsonValue(1));
  arr.push_back(JsonValue("potion"));
  arr.push_back(JsonValue(true));

  JsonValue arrayVal(arr);
  BOOST_CHECK(arrayVal.isArray());
  BOOST_CHECK_EQUAL(arrayVal.size(), 3);
  BOOST_CHECK_EQUAL(arrayVal[0].asInt(), 1);
  BOOST_CHECK_EQUAL(arrayVal[1].asString(), "potion");
  BOOST_CHECK_EQUAL(arrayVal[2].asBool(), true);

  // Out of range reads as null
  BOOST_CHECK(arrayVal[7].isNull());
}

BOOST_AUTO_TEST_CASE(TestObjectOperations) {
  JsonObject obj;
  obj["name"] = JsonValue("Aria");
  obj["level"] = JsonValue(3);
  obj["alive"] = JsonValue(true);

  JsonValue objectVal(obj);
  BOOST_CHECK(objectVal.isObject());
  BOOST_CHECK_EQUAL(objectVal.size(), 3);
  BOOST_CHECK(objectVal.hasKey("name"));
  BOOST_CHECK(!objectVal.hasKey("missing"));
  BOOST_CHECK_EQUAL(objectVal["name"].asString(), "Aria");
  BOOST_CHECK_EQUAL(objectVal["level"].asInt(), 3);
  BOOST_CHECK(objectVal["missing"].isNull());
  BOOST_CHECK(objectVal["missing"]["deeper"].isNull());
}

BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonValue stringVal("test");
  JsonValue numberVal(42);

  BOOST_CHECK(stringVal.tryAsString().has_value());
  BOOST_CHECK_EQUAL(stringVal.tryAsString().value(), "test");
  BOOST_CHECK(numberVal.tryAsInt().has_value());
  BOOST_CHECK_EQUAL(numberVal.tryAsInt().value(), 42);

  BOOST_CHECK(!stringVal.tryAsInt().has_value());
  BOOST_CHECK(!numberVal.tryAsString().has_value());
  BOOST_CHECK(stringVal.tryAsArray() == nullptr);
  BOOST_CHECK(numberVal.tryAsObject() == nullptr);
}

BOOST_AUTO_TEST_CASE(TestKeyedFallbacks) {
  JsonObject obj;
  obj["hp"] = JsonValue(12);
  obj["name"] = JsonValue("Mara");
  obj["ready"] = JsonValue(true);
  JsonValue value(obj);

  BOOST_CHECK_EQUAL(value.getInt("hp"), 12);
  BOOST_CHECK_EQUAL(value.getInt("mana", 6), 6);
  BOOST_CHECK_EQUAL(value.getString("name"), "Mara");
  BOOST_CHECK_EQUAL(value.getString("hp", "none"), "none");
  BOOST_CHECK_EQUAL(value.getBool("ready"), true);
  BOOST_CHECK_EQUAL(value.getBool("name", false), false);

  // Non-objects fall back for every key
  JsonValue number(3);
  BOOST_CHECK_EQUAL(number.getInt("hp", -1), -1);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonBuilderTests)

BOOST_AUTO_TEST_CASE(TestSetPromotesNullToObject) {
  JsonValue root;
  root.set("version", JsonValue(2));
  root.set("room", JsonValue("cellar"));
  root.set("version", JsonValue(3));

  BOOST_CHECK(root.isObject());
  BOOST_CHECK_EQUAL(root.size(), 2);
  BOOST_CHECK_EQUAL(root["version"].asInt(), 3);
}

BOOST_AUTO_TEST_CASE(TestPushPromotesNullToArray) {
  JsonValue list;
  list.push(JsonValue("potion"));
  JsonValue &entry = list.push(JsonValue());
  entry.set("id", JsonValue("worn_boots"));

  BOOST_CHECK(list.isArray());
  BOOST_REQUIRE_EQUAL(list.size(), 2);
  BOOST_CHECK_EQUAL(list[1]["id"].asString(), "worn_boots");
}

BOOST_AUTO_TEST_CASE(TestCompactOutputSortsKeys) {
  JsonValue root;
  root.set("zeta", JsonValue(1));
  root.set("alpha", JsonValue("a\"b"));
  JsonValue &list = root.set("list", JsonValue(JsonArray{}));
  list.push(JsonValue(true));
  list.push(JsonValue());

  BOOST_CHECK_EQUAL(root.toString(),
                    "{\"alpha\":\"a\\\"b\",\"list\":[true,null],\"zeta\":1}");
}

BOOST_AUTO_TEST_CASE(TestIndentedOutput) {
  JsonValue root;
  root.set("hp", JsonValue(10));
  root.set("spells", JsonValue(JsonArray{})).push(JsonValue("Spark"));
  root.set("empty", JsonValue(JsonObject{}));

  const std::string expected = "{\n"
                               "  \"empty\": {},\n"
                               "  \"hp\": 10,\n"
                               "  \"spells\": [\n"
                               "    \"Spark\"\n"
                               "  ]\n"
                               "}";
  BOOST_CHECK_EQUAL(root.toString(2), expected);
}

BOOST_AUTO_TEST_CASE(TestWrittenTextParsesBack) {
  JsonValue root;
  root.set("name", JsonValue("Line\nBreak\ttab"));
  root.set("ratio", JsonValue(0.5));

  JsonReader reader;
  BOOST_REQUIRE(reader.parse(root.toString(2)));
  BOOST_CHECK_EQUAL(reader.getRoot()["name"].asString(), "Line\nBreak\ttab");
  BOOST_CHECK_CLOSE(reader.getRoot()["ratio"].asNumber(), 0.5, 0.001);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderParsingTests)

BOOST_AUTO_TEST_CASE(TestBasicParsing) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_CHECK(reader.parse("true"));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), true);

  BOOST_CHECK(reader.parse("42"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), 42);

  BOOST_CHECK(reader.parse("-123"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), -123);

  BOOST_CHECK(reader.parse("1.5e2"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), 150.0, 0.001);

  BOOST_CHECK(reader.parse("\"hello\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "hello");
}

BOOST_AUTO_TEST_CASE(TestStringEscapes) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("\"hello\\nworld\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "hello\nworld");

  BOOST_CHECK(reader.parse("\"quote\\\"here\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "quote\"here");

  BOOST_CHECK(reader.parse("\"backslash\\\\here\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "backslash\\here");

  BOOST_CHECK(reader.parse("\"\\u0041\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "A");
}

BOOST_AUTO_TEST_CASE(TestNestedStructures) {
  JsonReader reader;

  std::string roomJson = R"({
        "id": "cellar",
        "exits": {"up": "courtyard"},
        "encounter": {
            "mobs": [
                {"name": "Big Rat", "hp": "1d4-1", "count": 2}
            ]
        }
    })";

  BOOST_REQUIRE(reader.parse(roomJson));
  const auto &root = reader.getRoot();
  BOOST_CHECK_EQUAL(root["id"].asString(), "cellar");
  BOOST_CHECK_EQUAL(root["exits"]["up"].asString(), "courtyard");

  const auto &mobs = root["encounter"]["mobs"];
  BOOST_REQUIRE_EQUAL(mobs.size(), 1);
  BOOST_CHECK_EQUAL(mobs[0]["name"].asString(), "Big Rat");
  BOOST_CHECK_EQUAL(mobs[0]["hp"].asString(), "1d4-1");
  BOOST_CHECK_EQUAL(mobs[0].getInt("count", 1), 2);
}

BOOST_AUTO_TEST_CASE(TestWhitespace) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("  \t\n  42  \r\n  "));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), 42);

  BOOST_CHECK(reader.parse("[\n  1,\n  2\n]"));
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 2);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderErrorTests)

BOOST_AUTO_TEST_CASE(TestInvalidJSON) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("hello"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("{\"key\": \"value\",}"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("[1, 2, 3,]"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("{\"key\": \"value\""));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("123."));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("\"hello"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("42 43"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestMalformedStructures) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("{\"key\" \"value\"}"));
  BOOST_CHECK(!reader.parse("{42: \"value\"}"));
  BOOST_CHECK(!reader.parse("[1 2 3]"));
  BOOST_CHECK(!reader.parse("truee"));
  BOOST_CHECK(!reader.parse("@"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestFailedParseClearsRoot) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse("{\"a\": 1}"));
  BOOST_CHECK(!reader.parse("{\"a\": "));
  BOOST_CHECK(reader.getRoot().isNull());

  // A good parse clears the previous error
  BOOST_CHECK(reader.parse("[]"));
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestDeepNestingRejected) {
  JsonReader reader;
  std::string deep(200, '[');
  deep += std::string(200, ']');
  BOOST_CHECK(!reader.parse(deep));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// FILE TESTS
// ============================================================================

struct JsonFileFixture {
  JsonFileFixture() { std::filesystem::remove_all(TEST_DIR); }
  ~JsonFileFixture() { std::filesystem::remove_all(TEST_DIR); }
};

BOOST_FIXTURE_TEST_SUITE(JsonFileTests, JsonFileFixture)

BOOST_AUTO_TEST_CASE(TestFileLoading) {
  std::filesystem::create_directories(TEST_DIR);
  const std::string filename = TEST_DIR + "/item.json";
  {
    std::ofstream file(filename);
    file << R"({"id": "leather_cap", "slot": "head", "ac_bonus": 1})";
  }

  JsonReader reader;
  BOOST_REQUIRE(reader.loadFromFile(filename));
  BOOST_CHECK_EQUAL(reader.getRoot()["slot"].asString(), "head");
  BOOST_CHECK_EQUAL(reader.getRoot().getInt("ac_bonus"), 1);
}

BOOST_AUTO_TEST_CASE(TestNonExistentFile) {
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile(TEST_DIR + "/missing.json"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestWriteCreatesDirectories) {
  const std::string path = TEST_DIR + "/nested/save.json";
  JsonValue root;
  root.set("version", JsonValue(2));
  root.set("room", JsonValue("spire"));

  std::string error;
  BOOST_REQUIRE(writeJsonFile(path, root, &error));
  BOOST_CHECK(error.empty());
  BOOST_CHECK(std::filesystem::exists(path));
  BOOST_CHECK(!std::filesystem::exists(path + ".tmp"));

  JsonReader reader;
  BOOST_REQUIRE(reader.loadFromFile(path));
  BOOST_CHECK_EQUAL(reader.getRoot()["room"].asString(), "spire");
}

BOOST_AUTO_TEST_CASE(TestWriteReplacesExistingFile) {
  const std::string path = TEST_DIR + "/save.json";
  JsonValue first;
  first.set("turn", JsonValue(1));
  BOOST_REQUIRE(writeJsonFile(path, first, nullptr));

  JsonValue second;
  second.set("turn", JsonValue(9));
  BOOST_REQUIRE(writeJsonFile(path, second, nullptr));

  JsonReader reader;
  BOOST_REQUIRE(reader.loadFromFile(path));
  BOOST_CHECK_EQUAL(reader.getRoot().getInt("turn"), 9);
}

BOOST_AUTO_TEST_SUITE_END()
