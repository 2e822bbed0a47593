/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>
#include <string>

using namespace OvermapAtlas;

namespace {

constexpr int OMT_RUN_LENGTH = 180;

} // namespace

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestScalarValues) {
  const JsonValue nothing;
  BOOST_CHECK(nothing.isNull());
  BOOST_CHECK_EQUAL(nothing.toString(), "null");

  const JsonValue linear(true);
  BOOST_CHECK(linear.isBool());
  BOOST_CHECK(linear.asBool());
  BOOST_CHECK_EQUAL(JsonValue(false).toString(), "false");

  const JsonValue runLength(OMT_RUN_LENGTH);
  BOOST_CHECK(runLength.isNumber());
  BOOST_CHECK_EQUAL(runLength.asInt(), OMT_RUN_LENGTH);
  BOOST_CHECK_CLOSE(JsonValue(0.25).asNumber(), 0.25, 0.001);

  const JsonValue sym("^");
  BOOST_CHECK(sym.isString());
  BOOST_CHECK_EQUAL(sym.asString(), "^");
  BOOST_CHECK_EQUAL(sym.toString(), "\"^\"");
}

BOOST_AUTO_TEST_CASE(TestRunArray) {
  const JsonValue run(JsonArray{JsonValue("forest_thick"), JsonValue(OMT_RUN_LENGTH)});
  BOOST_CHECK(run.isArray());
  BOOST_CHECK_EQUAL(run.size(), 2);
  BOOST_CHECK_EQUAL(run[0].asString(), "forest_thick");
  BOOST_CHECK_EQUAL(run[1].asInt(), OMT_RUN_LENGTH);
  BOOST_CHECK(run[2].isNull());
}

BOOST_AUTO_TEST_CASE(TestTerrainObject) {
  JsonObject terrain;
  terrain["id"] = JsonValue("field");
  terrain["sym"] = JsonValue(".");
  terrain["see_cost"] = JsonValue(2);

  const JsonValue value(terrain);
  BOOST_CHECK(value.isObject());
  BOOST_CHECK_EQUAL(value.size(), 3);
  BOOST_CHECK(value.hasKey("sym"));
  BOOST_CHECK(!value.hasKey("color"));
  BOOST_CHECK_EQUAL(value["id"].asString(), "field");
  BOOST_CHECK_EQUAL(value["see_cost"].asInt(), 2);
}

BOOST_AUTO_TEST_CASE(TestTryAccessors) {
  const JsonValue omtype("road_ns");
  const JsonValue length(4);

  BOOST_CHECK_EQUAL(omtype.tryAsString().value_or(""), "road_ns");
  BOOST_CHECK_EQUAL(length.tryAsInt().value_or(-1), 4);
  BOOST_CHECK(!JsonValue(4.5).tryAsInt().has_value());

  BOOST_CHECK(!omtype.tryAsInt().has_value());
  BOOST_CHECK(!length.tryAsString().has_value());
  BOOST_CHECK(!length.tryAsBool().has_value());
  BOOST_CHECK(omtype.tryAsArray() == nullptr);
  BOOST_CHECK(length.tryAsObject() == nullptr);
}

BOOST_AUTO_TEST_CASE(TestMissingKeyIsNull) {
  JsonObject obj;
  obj["sym"] = JsonValue("^");
  const JsonValue objectVal(obj);

  BOOST_CHECK(objectVal["color"].isNull());
  BOOST_CHECK(objectVal["name"]["str"].isNull());
  BOOST_CHECK(objectVal[5].isNull());
  // Const lookups never insert
  BOOST_CHECK_EQUAL(objectVal.size(), 1);
}

BOOST_AUTO_TEST_CASE(TestSerialisationSortsKeys) {
  JsonObject obj;
  obj["sym"] = JsonValue("^");
  obj["color"] = JsonValue("brown");
  obj["flags"] = JsonValue(JsonArray{JsonValue("LINEAR")});
  obj["name"] = JsonValue("road \"A\"");

  BOOST_CHECK_EQUAL(JsonValue(obj).toString(),
                    "{\"color\":\"brown\",\"flags\":[\"LINEAR\"],"
                    "\"name\":\"road \\\"A\\\"\",\"sym\":\"^\"}");
}

BOOST_AUTO_TEST_CASE(TestEquality) {
  JsonReader first;
  JsonReader second;
  BOOST_REQUIRE(first.parse(R"({"a": [1, 2, {"b": null}], "c": true})"));
  BOOST_REQUIRE(second.parse(R"({"c": true, "a": [1, 2, {"b": null}]})"));
  BOOST_CHECK(first.getRoot() == second.getRoot());

  BOOST_REQUIRE(second.parse(R"({"c": false, "a": [1, 2, {"b": null}]})"));
  BOOST_CHECK(first.getRoot() != second.getRoot());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderParsingTests)

BOOST_AUTO_TEST_CASE(TestScalarDocuments) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());
  BOOST_CHECK(reader.parse("false"));
  BOOST_CHECK(!reader.getRoot().asBool());

  BOOST_CHECK(reader.parse("-10"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), -10);
  BOOST_CHECK(reader.parse("2.5E1"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), 25.0, 0.001);
  BOOST_CHECK(reader.parse("0"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), 0);

  BOOST_CHECK(reader.parse("\"open_air\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "open_air");
}

BOOST_AUTO_TEST_CASE(TestStringEscapes) {
  JsonReader reader;

  BOOST_CHECK(reader.parse(R"("line\nbreak\ttab")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "line\nbreak\ttab");

  BOOST_CHECK(reader.parse(R"("say \"hi\" \\ bye")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "say \"hi\" \\ bye");

  BOOST_CHECK(reader.parse(R"("\u0041")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "A");

  // Box drawing glyphs arrive escaped in some data files
  BOOST_CHECK(reader.parse(R"("\u2502")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xE2\x94\x82");

  // Surrogate pair
  BOOST_CHECK(reader.parse(R"("\ud83d\ude00")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xF0\x9F\x98\x80");

  BOOST_CHECK(reader.parse(R"("\/")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "/");
}

BOOST_AUTO_TEST_CASE(TestUtf8PassThrough) {
  JsonReader reader;
  BOOST_CHECK(reader.parse("{\"sym\": \"\xE2\x94\xBC\"}"));
  BOOST_CHECK_EQUAL(reader.getRoot()["sym"].asString(), "\xE2\x94\xBC");

  // Byte order mark before the document
  BOOST_CHECK(reader.parse("\xEF\xBB\xBF[1]"));
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 1);
}

BOOST_AUTO_TEST_CASE(TestEmptyContainers) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("[]"));
  BOOST_CHECK(reader.getRoot().isArray());
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 0);

  BOOST_CHECK(reader.parse("{ }"));
  BOOST_CHECK(reader.getRoot().isObject());
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 0);
}

BOOST_AUTO_TEST_CASE(TestOvermapLayerDocument) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"({"layers": [
    [["empty_rock", 32400]],
    [["field", 100], ["road_ew", 3], ["house_north", 1], ["field", 32296]]
  ]})"));

  const JsonValue &layers = reader.getRoot()["layers"];
  BOOST_REQUIRE(layers.isArray());
  BOOST_CHECK_EQUAL(layers.size(), 2);
  BOOST_CHECK_EQUAL(layers[0][0][0].asString(), "empty_rock");
  BOOST_CHECK_EQUAL(layers[0][0][1].asInt(), 32400);

  const JsonValue &ground = layers[1];
  BOOST_CHECK_EQUAL(ground.size(), 4);
  BOOST_CHECK_EQUAL(ground[2][0].asString(), "house_north");
  BOOST_CHECK_EQUAL(ground[2][1].asInt(), 1);
}

BOOST_AUTO_TEST_CASE(TestContentRecord) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"([
    {
      "type": "overmap_terrain",
      "id": ["house", "house_base"],
      "copy-from": "generic_city_building",
      "name": {"str": "house"},
      "flags": ["SOURCE_PEOPLE", "SIDEWALK"],
      "mapgen": [{"method": "json", "om_terrain": "house"}],
      "see_cost": 2,
      "extend": {"flags": ["RISK_HIGH"]}
    }
  ])"));

  const JsonValue &house = reader.getRoot()[0];
  BOOST_CHECK(house.hasKey("copy-from"));
  BOOST_CHECK_EQUAL(house["id"].size(), 2);
  BOOST_CHECK_EQUAL(house["id"][1].asString(), "house_base");
  BOOST_CHECK_EQUAL(house["name"]["str"].asString(), "house");
  BOOST_CHECK_EQUAL(house["flags"][1].asString(), "SIDEWALK");
  BOOST_CHECK_EQUAL(house["mapgen"][0]["method"].asString(), "json");
  BOOST_CHECK_EQUAL(house["see_cost"].asInt(), 2);
  BOOST_CHECK_EQUAL(house["extend"]["flags"][0].asString(), "RISK_HIGH");
}

BOOST_AUTO_TEST_CASE(TestWhitespace) {
  JsonReader reader;

  BOOST_CHECK(reader.parse(" \r\n\t 7 \n"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), 7);

  BOOST_CHECK(reader.parse("[\n\t[\"field\" ,\r\n 9 ]\n]"));
  BOOST_CHECK_EQUAL(reader.getRoot()[0][1].asInt(), 9);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderErrorTests)

BOOST_AUTO_TEST_CASE(TestRejectedDocuments) {
  const char *invalid[] = {
      "field",                         // bare word
      R"({"id": "field",})",           // trailing comma in object
      R"([["field", 1],])",            // trailing comma in array
      R"({"id": "field")",             // unclosed object
      R"([["field", 1])",              // unclosed array
      "12.",                           // truncated fraction
      "-",                             // lone sign
      R"("unterminated)",              // unterminated string
      R"("bad \q escape")",            // unknown escape
      R"("\u12")",                     // short unicode escape
      "1 2",                           // two roots
      R"({"id" "field"})",             // missing colon
      R"({7: "field"})",               // non-string key
      R"({"a": 1 "b": 2})",            // missing member separator
      R"(["a" "b"])",                  // missing element separator
      "tru",                           // truncated literal
      "nulls",                         // literal with trailing garbage
      "@",                             // stray character
      "# comment only",                // comment without skip flag
  };

  JsonReader reader;
  for (const char *document : invalid) {
    BOOST_CHECK_MESSAGE(!reader.parse(document), "accepted: " << document);
    BOOST_CHECK(!reader.getLastError().empty());
  }
}

BOOST_AUTO_TEST_CASE(TestErrorPosition) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{\n  \"type\": \"overmap_terrain\",\n  \"id\" \"field\"\n}"));
  BOOST_CHECK(reader.getLastError().starts_with("Line 3, Column "));
}

BOOST_AUTO_TEST_CASE(TestEmptyInput) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse(""));
  BOOST_CHECK(!reader.parse("   \n\t"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestNestingLimit) {
  JsonReader reader;
  const std::string deep = std::string(600, '[') + std::string(600, ']');
  BOOST_CHECK(!reader.parse(deep));
  BOOST_CHECK(!reader.getLastError().empty());

  const std::string shallow = std::string(100, '[') + std::string(100, ']');
  BOOST_CHECK(reader.parse(shallow));
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestErrorClearedOnSuccess) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("[1,"));
  BOOST_CHECK(!reader.getLastError().empty());
  BOOST_CHECK(reader.parse("[1]"));
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CommentLineTests)

BOOST_AUTO_TEST_CASE(TestStripCommentLine) {
  BOOST_CHECK_EQUAL(JsonReader::stripCommentLine("# version 33\n{\"a\":1}"), "{\"a\":1}");
  BOOST_CHECK_EQUAL(JsonReader::stripCommentLine("{\"a\":1}"), "{\"a\":1}");
  BOOST_CHECK_EQUAL(JsonReader::stripCommentLine("# only a comment"), "");
  BOOST_CHECK_EQUAL(JsonReader::stripCommentLine(""), "");
  // Only the first line is considered
  BOOST_CHECK_EQUAL(JsonReader::stripCommentLine("[1,\n# 2\n]"), "[1,\n# 2\n]");
}

BOOST_AUTO_TEST_SUITE_END()

struct TempJsonFileFixture {
  std::filesystem::path dir;

  TempJsonFileFixture()
      : dir(std::filesystem::temp_directory_path() / "overmap_atlas_json_reader_test") {
    std::filesystem::create_directories(dir);
  }

  ~TempJsonFileFixture() {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }

  std::string write(const std::string& name, const std::string& content) const {
    const auto path = dir / name;
    std::ofstream file(path, std::ios::binary);
    file << content;
    return path.string();
  }
};

BOOST_FIXTURE_TEST_SUITE(JsonReaderFileTests, TempJsonFileFixture)

BOOST_AUTO_TEST_CASE(TestFileLoading) {
  const std::string filename = write("terrain.json", R"([
        {
            "type": "overmap_terrain",
            "id": "field",
            "name": "field",
            "sym": ".",
            "color": "brown",
            "see_cost": 2,
            "flags": ["NO_ROTATE"]
        }
    ])");

  JsonReader reader;
  BOOST_CHECK(reader.loadFromFile(filename));

  const auto &root = reader.getRoot();
  BOOST_REQUIRE(root.isArray());
  BOOST_CHECK_EQUAL(root.size(), 1);
  BOOST_CHECK_EQUAL(root[0]["type"].asString(), "overmap_terrain");
  BOOST_CHECK_EQUAL(root[0]["id"].asString(), "field");
  BOOST_CHECK_EQUAL(root[0]["see_cost"].asInt(), 2);
  BOOST_CHECK_EQUAL(root[0]["flags"][0].asString(), "NO_ROTATE");
}

BOOST_AUTO_TEST_CASE(TestSaveFileWithCommentLine) {
  const std::string filename =
      write("o.0.0", "# version 33\n{\"layers\": [[[\"field\", 32400]]]}");

  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile(filename));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(reader.loadFromFile(filename, true));
  const auto &layers = reader.getRoot()["layers"];
  BOOST_REQUIRE(layers.isArray());
  BOOST_CHECK_EQUAL(layers[0][0][0].asString(), "field");
  BOOST_CHECK_EQUAL(layers[0][0][1].asInt(), 32400);
}

BOOST_AUTO_TEST_CASE(TestCommentLineOptional) {
  const std::string filename = write("o.1.0", "{\"layers\": []}");

  JsonReader reader;
  BOOST_CHECK(reader.loadFromFile(filename, true));
  BOOST_CHECK(reader.getRoot()["layers"].isArray());
}

BOOST_AUTO_TEST_CASE(TestNonExistentFile) {
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile((dir / "non_existent_file.json").string()));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestTakeRoot) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"({"id": ["road", "road_nesw"]})"));
  JsonValue root = reader.takeRoot();
  BOOST_CHECK_EQUAL(root["id"].size(), 2);
  BOOST_CHECK_EQUAL(root["id"][1].asString(), "road_nesw");
}

BOOST_AUTO_TEST_SUITE_END()
