/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE GridProjectorTests
#include <boost/test/unit_test.hpp>

#include "gamedata/DefinitionStore.hpp"
#include "overmap/GridProjector.hpp"
#include "overmap/OvermapTile.hpp"
#include <cstdio>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace OvermapAtlas;

namespace {

const char *TERRAIN_JSON = R"([
  {"type": "overmap_terrain", "id": "field", "name": "field", "sym": ".", "color": "brown"},
  {"type": "overmap_terrain", "abstract": "generic_house", "name": {"str": "house"},
   "sym": "^", "color": "light_green"},
  {"type": "overmap_terrain", "id": "house", "copy-from": "generic_house"},
  {"type": "overmap_terrain", "id": "road", "name": "road", "sym": "│", "color": "dark_gray",
   "flags": ["LINEAR"]},
  {"type": "overmap_terrain", "id": "blank", "name": "blank", "color": "white"}
])";

// z=0 holds the given layer; every other level is a single field run
std::string tileWithGround(const std::string &groundLayer) {
  std::string json = R"({"layers": [)";
  for (int z = MIN_Z_LEVEL; z <= MAX_Z_LEVEL; ++z) {
    if (z != MIN_Z_LEVEL) {
      json += ",";
    }
    json += z == 0 ? groundLayer : std::format(R"([["field", {}]])", OMT_CELL_COUNT);
  }
  return json + "]}";
}

// Points file descriptor 1 at a temporary file for the fixture's lifetime
class StdoutCapture {
public:
  StdoutCapture()
      : m_path(std::filesystem::temp_directory_path() / "overmap_atlas_stdout.txt") {
    std::cout.flush();
    std::fflush(stdout);
    m_savedFd = ::dup(STDOUT_FILENO);
    const int fd = ::open(m_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    BOOST_REQUIRE(m_savedFd >= 0 && fd >= 0);
    ::dup2(fd, STDOUT_FILENO);
    ::close(fd);
  }

  ~StdoutCapture() {
    restore();
    std::error_code ec;
    std::filesystem::remove(m_path, ec);
  }

  std::vector<std::string> lines() {
    restore();
    std::vector<std::string> result;
    std::ifstream file(m_path);
    for (std::string line; std::getline(file, line);) {
      result.push_back(line);
    }
    return result;
  }

private:
  void restore() {
    if (m_savedFd < 0) {
      return;
    }
    std::cout.flush();
    std::fflush(stdout);
    ::dup2(m_savedFd, STDOUT_FILENO);
    ::close(m_savedFd);
    m_savedFd = -1;
  }

  std::filesystem::path m_path;
  int m_savedFd{-1};
};

} // namespace

struct ProjectedTileFixture {
  DefinitionStore store;
  OvermapTile tile{0, 0};

  ProjectedTileFixture() {
    BOOST_REQUIRE(store.loadString(TERRAIN_JSON, "overmap_terrain.json"));
    store.resolve();
    // Row 0: house_east, road_ew, blank, lab, field...; the layer stops after row 1
    BOOST_REQUIRE(tile.parse(tileWithGround(std::format(
                                 R"([["house_east", 1], ["road_ew", 1], ["blank", 1], ["lab", 1], ["field", {}]])",
                                 2 * OMT_SIZE - 4)),
                             "o.0.0"));
    BOOST_REQUIRE(tile.resolveSymbols(store));
  }
};

BOOST_FIXTURE_TEST_SUITE(GridProjectorTestSuite, ProjectedTileFixture)

BOOST_AUTO_TEST_CASE(TestGridDimensions) {
  const OvermapGrid grid = GridProjector::project(tile, 0);
  BOOST_REQUIRE_EQUAL(grid.size(), OMT_SIZE);
  for (const auto &row : grid) {
    BOOST_CHECK_EQUAL(row.size(), OMT_SIZE);
  }
}

BOOST_AUTO_TEST_CASE(TestPlaceholdersAreDistinguishable) {
  const auto &unexplored = GridProjector::unexploredCell();
  const auto &unknown = GridProjector::unknownTerrainCell();
  const auto &missing = GridProjector::missingSymbolCell();

  BOOST_CHECK_EQUAL(unexplored.glyph, "#");
  BOOST_CHECK_EQUAL(unexplored.name, "Unexplored");
  BOOST_CHECK_EQUAL(unknown.glyph, "!");
  BOOST_CHECK_EQUAL(unknown.name, "Unknown");
  BOOST_CHECK_EQUAL(missing.glyph, "?");
  BOOST_CHECK_EQUAL(missing.name, "Unknown");
  BOOST_CHECK(!(unexplored == unknown));
  BOOST_CHECK(!(unknown == missing));
  BOOST_CHECK(!unexplored.id && !unknown.id && !missing.id);
  BOOST_CHECK_EQUAL(unexplored.color, "gray");
}

BOOST_AUTO_TEST_CASE(TestResolvedCells) {
  const OvermapGrid grid = GridProjector::project(tile, 0);

  // Glyph override from the direction suffix, everything else from the definition
  const ProjectedCell &house = grid[0][0];
  BOOST_CHECK_EQUAL(house.glyph, ">");
  BOOST_CHECK_EQUAL(house.color, "light_green");
  BOOST_CHECK_EQUAL(house.name, "house");
  BOOST_CHECK_EQUAL(house.id.value_or(""), "house");

  const ProjectedCell &road = grid[0][1];
  BOOST_CHECK_EQUAL(road.glyph, "─");
  BOOST_CHECK_EQUAL(road.id.value_or(""), "road");

  const ProjectedCell &field = grid[1][0];
  BOOST_CHECK_EQUAL(field.glyph, ".");
  BOOST_CHECK_EQUAL(field.color, "brown");
  BOOST_CHECK_EQUAL(field.name, "field");
  BOOST_CHECK_EQUAL(field.id.value_or(""), "field");
}

BOOST_AUTO_TEST_CASE(TestUnresolvedCells) {
  const OvermapGrid grid = GridProjector::project(tile, 0);

  // Definition without a sym
  BOOST_CHECK(grid[0][2] == GridProjector::missingSymbolCell());
  // Type without a definition
  BOOST_CHECK(grid[0][3] == GridProjector::unknownTerrainCell());
  // The last decoded cell, then everything beyond it
  BOOST_CHECK_EQUAL(grid[1][OMT_SIZE - 1].glyph, ".");
  BOOST_CHECK(grid[2][0] == GridProjector::unexploredCell());
  BOOST_CHECK(grid[OMT_SIZE - 1][OMT_SIZE - 1] == GridProjector::unexploredCell());
}

BOOST_AUTO_TEST_CASE(TestOtherLevels) {
  const OvermapGrid below = GridProjector::project(tile, -1);
  BOOST_CHECK_EQUAL(below[OMT_SIZE - 1][OMT_SIZE - 1].glyph, ".");

  const OvermapGrid outside = GridProjector::project(tile, MAX_Z_LEVEL + 1);
  BOOST_CHECK(outside[0][0] == GridProjector::unexploredCell());
}

BOOST_AUTO_TEST_CASE(TestTextRendering) {
  const std::string text = GridProjector::toText(GridProjector::project(tile, 0));

  std::istringstream stream(text);
  std::string line;
  int lines = 0;
  while (std::getline(stream, line)) {
    if (lines == 0) {
      BOOST_CHECK(line.starts_with(">─?!...."));
    } else if (lines >= 2) {
      BOOST_CHECK_EQUAL(line, std::string(OMT_SIZE, '#'));
    }
    ++lines;
  }
  BOOST_CHECK_EQUAL(lines, OMT_SIZE);
  BOOST_CHECK(text.ends_with('\n'));
}

BOOST_AUTO_TEST_CASE(TestEmptyGridText) {
  BOOST_CHECK_EQUAL(GridProjector::toText(OvermapGrid{}), "");

  OvermapGrid grid(2, std::vector<ProjectedCell>(3, GridProjector::unknownTerrainCell()));
  BOOST_CHECK_EQUAL(GridProjector::toText(grid), "!!!\n!!!\n");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TextOutputTests)

BOOST_AUTO_TEST_CASE(TestStdoutHoldsOnlyGridRows) {
  // Every cell is an unknown type, so resolving and projecting log per cell
  std::vector<std::string> captured;
  {
    StdoutCapture capture;

    DefinitionStore store;
    BOOST_REQUIRE(store.loadString(
        R"({"type": "overmap_terrain", "id": "field", "sym": ".", "color": "brown"})",
        "field.json"));
    store.resolve();

    OvermapTile tile(3, -7);
    BOOST_REQUIRE(tile.parse(
        tileWithGround(std::format(R"([["mystery_site", {}]])", OMT_CELL_COUNT)), "o.3.-7"));
    BOOST_REQUIRE(tile.resolveSymbols(store));

    std::cout << GridProjector::toText(GridProjector::project(tile, 0));
    captured = capture.lines();
  }

  BOOST_REQUIRE_EQUAL(captured.size(), static_cast<size_t>(OMT_SIZE));
  for (const auto &line : captured) {
    BOOST_CHECK_EQUAL(line, std::string(OMT_SIZE, '!'));
  }
}

BOOST_AUTO_TEST_SUITE_END()
