/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>

using namespace LatticeMint;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);
  BOOST_CHECK_EQUAL(nullVal.toString(), "null");

  JsonValue trueVal(true);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.asBool(), true);
  BOOST_CHECK_EQUAL(trueVal.toString(), "true");

  JsonValue intVal(42);
  JsonValue doubleVal(3.5);
  BOOST_CHECK(intVal.isNumber());
  BOOST_CHECK_EQUAL(intVal.toString(), "42");
  BOOST_CHECK_CLOSE(doubleVal.asNumber(), 3.5, 0.001);
  BOOST_CHECK_EQUAL(doubleVal.toString(), "3.5");

  JsonValue stringVal("hello");
  BOOST_CHECK(stringVal.isString());
  BOOST_CHECK_EQUAL(stringVal.asString(), "hello");
  BOOST_CHECK_EQUAL(stringVal.toString(), "\"hello\"");
}

BOOST_AUTO_TEST_CASE(TestObjectOperations) {
  JsonValue object;
  object["name"] = JsonValue("Lattice");
  object["supply"] = JsonValue(uint64_t{3});
  object["open"] = JsonValue(true);

  BOOST_CHECK(object.isObject());
  BOOST_CHECK_EQUAL(object.size(), 3u);
  BOOST_CHECK(object.hasKey("name"));
  BOOST_CHECK(!object.hasKey("missing"));

  const JsonValue &view = object;
  BOOST_CHECK(view["missing"].isNull());
  BOOST_CHECK_EQUAL(view["name"].asString(), "Lattice");

  // Keys serialize in sorted order
  BOOST_CHECK_EQUAL(object.toString(),
                    "{\"name\":\"Lattice\",\"open\":true,\"supply\":3}");
}

BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonValue stringVal("test");
  JsonValue numberVal(42);
  JsonValue negative(-1);
  JsonValue fraction(1.5);

  BOOST_CHECK_EQUAL(stringVal.tryAsString().value(), "test");
  BOOST_CHECK(!stringVal.tryAsNumber().has_value());
  BOOST_CHECK(!stringVal.tryAsUnsigned().has_value());
  BOOST_CHECK(!numberVal.tryAsString().has_value());
  BOOST_CHECK(!numberVal.tryAsBool().has_value());

  BOOST_CHECK_EQUAL(numberVal.tryAsUnsigned().value(), 42u);
  BOOST_CHECK(!negative.tryAsUnsigned().has_value());
  BOOST_CHECK(!fraction.tryAsUnsigned().has_value());
}

BOOST_AUTO_TEST_CASE(TestStringEscapingOnOutput) {
  JsonValue text(std::string("line\n\"quoted\"\\"));
  BOOST_CHECK_EQUAL(text.toString(), "\"line\\n\\\"quoted\\\"\\\\\"");

  JsonValue control(std::string(1, '\x01'));
  BOOST_CHECK_EQUAL(control.toString(), "\"\\u0001\"");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderParsingTests)

BOOST_AUTO_TEST_CASE(TestBasicParsing) {
  JsonReader reader;

  BOOST_REQUIRE(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_REQUIRE(reader.parse("false"));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), false);

  BOOST_REQUIRE(reader.parse("-12.5e1"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), -125.0, 0.001);

  BOOST_REQUIRE(reader.parse("\"text\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "text");
}

BOOST_AUTO_TEST_CASE(TestStringEscapes) {
  JsonReader reader;

  BOOST_REQUIRE(reader.parse(R"("a\"b\\c\/d\n\t")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "a\"b\\c/d\n\t");

  BOOST_REQUIRE(reader.parse(R"("\u00e9")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xC3\xA9");

  // Surrogate pair for U+1F600
  BOOST_REQUIRE(reader.parse(R"("\ud83d\ude00")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xF0\x9F\x98\x80");
}

BOOST_AUTO_TEST_CASE(TestNestedStructures) {
  JsonReader reader;
  const std::string json = R"({
    "collection": {
      "name": "Crystal",
      "params": { "dimensions": 3, "connections": [[0, 1, 0.5], [1, 2, 1.0]] }
    },
    "tags": ["a", "b"]
  })";

  BOOST_REQUIRE(reader.parse(json));
  const JsonValue &root = reader.getRoot();
  BOOST_CHECK_EQUAL(root["collection"]["name"].asString(), "Crystal");
  BOOST_CHECK_EQUAL(root["collection"]["params"]["dimensions"].asNumber(), 3.0);

  const JsonArray &connections =
      root["collection"]["params"]["connections"].asArray();
  BOOST_REQUIRE_EQUAL(connections.size(), 2u);
  BOOST_CHECK_CLOSE(connections[0].asArray()[2].asNumber(), 0.5, 0.001);
  BOOST_CHECK_EQUAL(root["tags"].size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestWhitespace) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(" \n\t{ \"a\" :\r\n 1 } \n"));
  BOOST_CHECK_EQUAL(reader.getRoot()["a"].asNumber(), 1.0);
}

BOOST_AUTO_TEST_CASE(TestCompactRoundTrip) {
  JsonReader reader;
  const std::string compact = R"({"a":[1,2.25,"x"],"b":{"c":null,"d":false}})";
  BOOST_REQUIRE(reader.parse(compact));
  BOOST_CHECK_EQUAL(reader.getRoot().toString(), compact);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderErrorTests)

BOOST_AUTO_TEST_CASE(TestInvalidJSON) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse(""));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("{"));
  BOOST_CHECK(!reader.parse("[1, 2"));
  BOOST_CHECK(!reader.parse("{\"a\" 1}"));
  BOOST_CHECK(!reader.parse("{\"a\": 1,}"));
  BOOST_CHECK(!reader.parse("[1 2]"));
  BOOST_CHECK(!reader.parse("\"unterminated"));
  BOOST_CHECK(!reader.parse("01"));
  BOOST_CHECK(!reader.parse("1."));
  BOOST_CHECK(!reader.parse("tru"));
  BOOST_CHECK(!reader.parse("{} extra"));
  BOOST_CHECK(!reader.parse(R"("\x")"));
  BOOST_CHECK(!reader.parse(R"("\ud83d")"));
}

BOOST_AUTO_TEST_CASE(TestErrorPosition) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{\n  \"a\": @\n}"));
  BOOST_CHECK_NE(reader.getLastError().find("line 2"), std::string::npos);
  BOOST_CHECK(reader.getRoot().isNull());
}

BOOST_AUTO_TEST_CASE(TestFailedParseResetsRoot) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse("{\"a\": 1}"));
  BOOST_CHECK(reader.getRoot().isObject());

  BOOST_CHECK(!reader.parse("{\"a\": }"));
  BOOST_CHECK(reader.getRoot().isNull());
}

BOOST_AUTO_TEST_CASE(TestDepthLimit) {
  JsonReader reader;
  std::string deep(100, '[');
  deep += std::string(100, ']');
  BOOST_CHECK(!reader.parse(deep));
  BOOST_CHECK_NE(reader.getLastError().find("depth"), std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderFileTests)

BOOST_AUTO_TEST_CASE(TestFileLoading) {
  const std::string path = "json_reader_test.json";
  {
    std::ofstream file(path);
    file << R"({"admin": "root", "platform_fee_bps": 250})";
  }

  JsonReader reader;
  BOOST_REQUIRE(reader.loadFromFile(path));
  BOOST_CHECK_EQUAL(reader.getRoot()["admin"].asString(), "root");
  BOOST_CHECK_EQUAL(reader.getRoot()["platform_fee_bps"].tryAsUnsigned().value(),
                    250u);

  std::filesystem::remove(path);
}

BOOST_AUTO_TEST_CASE(TestNonExistentFile) {
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile("does_not_exist.json"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_SUITE_END()
