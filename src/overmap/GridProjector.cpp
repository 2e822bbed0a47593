/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "overmap/GridProjector.hpp"
#include "core/Logger.hpp"
#include "overmap/OvermapConstants.hpp"
#include "overmap/OvermapTile.hpp"
#include <format>
#include <utility>

namespace OvermapAtlas {

namespace {

// Translated names arrive either as a plain string or as {"str": "..."}
std::string displayName(const Definition &terrain) {
  const JsonValue &name = terrain.getField("name");
  if (auto plain = name.tryAsString()) {
    return *plain;
  }
  return name["str"].tryAsString().value_or("");
}

ProjectedCell projectCell(const OvermapCell &cell) {
  DefinitionPtr terrain = cell.getTerrain();
  if (!terrain) {
    PROJECTOR_WARN(std::format("Missing overmap_terrain data at <{},{}> "
                               "(omtype={})",
                               cell.x, cell.y, cell.omtype));
    return GridProjector::unknownTerrainCell();
  }

  std::optional<std::string> glyph = cell.glyph;
  if (!glyph) {
    glyph = terrain->getString("sym");
  }
  if (!glyph) {
    PROJECTOR_WARN(std::format("Missing symbol for <{},{}> (omtype={})",
                               cell.x, cell.y, cell.omtype));
    return GridProjector::missingSymbolCell();
  }

  return ProjectedCell{*glyph, terrain->getString("color").value_or(""),
                       displayName(*terrain), terrain->getId()};
}

} // namespace

const ProjectedCell &GridProjector::unexploredCell() {
  static const ProjectedCell cell{"#", "gray", "Unexplored", std::nullopt};
  return cell;
}

const ProjectedCell &GridProjector::unknownTerrainCell() {
  static const ProjectedCell cell{"!", "gray", "Unknown", std::nullopt};
  return cell;
}

const ProjectedCell &GridProjector::missingSymbolCell() {
  static const ProjectedCell cell{"?", "gray", "Unknown", std::nullopt};
  return cell;
}

OvermapGrid GridProjector::project(const OvermapTile &tile, int z) {
  if (!isValidZLevel(z)) {
    PROJECTOR_WARN(std::format("z={} is outside the stored band [{}, {}]", z,
                               MIN_Z_LEVEL, MAX_Z_LEVEL));
  }

  OvermapGrid grid;
  grid.reserve(OMT_SIZE);
  for (int y = 0; y < OMT_SIZE; ++y) {
    std::vector<ProjectedCell> row;
    row.reserve(OMT_SIZE);
    for (int x = 0; x < OMT_SIZE; ++x) {
      std::optional<OvermapCell> cell = tile.getTile(x, y, z);
      row.push_back(cell ? projectCell(*cell) : unexploredCell());
    }
    grid.push_back(std::move(row));
  }
  return grid;
}

std::string GridProjector::toText(const OvermapGrid &grid) {
  std::string text;
  text.reserve(grid.size() * (OMT_SIZE * 3 + 1));
  for (const auto &row : grid) {
    for (const auto &cell : row) {
      text += cell.glyph;
    }
    text += '\n';
  }
  return text;
}

} // namespace OvermapAtlas
