/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "overmap/OvermapTile.hpp"
#include "core/Logger.hpp"
#include "gamedata/DefinitionStore.hpp"
#include "overmap/LineGlyphs.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <filesystem>
#include <format>

namespace OvermapAtlas {

namespace {

const std::string OVERMAP_TERRAIN_CATEGORY = "overmap_terrain";
const std::string LINEAR_FLAG = "LINEAR";
const std::string SYM_KEY = "sym";

// Each run is encoded as [omtype, length]
constexpr size_t RUN_TYPE_SLOT = 0;
constexpr size_t RUN_LENGTH_SLOT = 1;

} // namespace

OvermapTile::OvermapTile(int overX, int overY)
    : m_overX(overX), m_overY(overY) {}

std::optional<std::pair<int, int>>
OvermapTile::coordsFromFilename(const std::string &path) {
  const std::string name = std::filesystem::path(path).filename().string();
  if (!name.starts_with("o.")) {
    return std::nullopt;
  }

  const char *end = name.data() + name.size();
  int x = 0;
  int y = 0;
  auto [xEnd, xError] = std::from_chars(name.data() + 2, end, x);
  if (xError != std::errc{} || xEnd == end || *xEnd != '.') {
    return std::nullopt;
  }
  auto [yEnd, yError] = std::from_chars(xEnd + 1, end, y);
  if (yError != std::errc{} || yEnd != end) {
    return std::nullopt;
  }
  return std::make_pair(x, y);
}

void OvermapTile::clear() {
  m_sourceFile.clear();
  m_types.clear();
  m_typeIndex.clear();
  for (auto &layer : m_layers) {
    layer.clear();
  }
}

bool OvermapTile::loadFromFile(const std::string &path) {
  clear();
  OVERMAP_DEBUG(std::format("Loading overmap tile <{}, {}> from {}", m_overX,
                            m_overY, path));

  JsonReader reader;
  if (!reader.loadFromFile(path, true)) {
    OVERMAP_ERROR(std::format("Failed to parse overmap tile '{}': {}", path,
                              reader.getLastError()));
    return false;
  }

  m_sourceFile = path;
  return decodeLayers(reader.getRoot());
}

bool OvermapTile::parse(const std::string &json, const std::string &sourceName) {
  clear();

  JsonReader reader;
  if (!reader.parse(JsonReader::stripCommentLine(json))) {
    OVERMAP_ERROR(std::format("Failed to parse overmap tile '{}': {}",
                              sourceName, reader.getLastError()));
    return false;
  }

  m_sourceFile = sourceName;
  return decodeLayers(reader.getRoot());
}

bool OvermapTile::decodeLayers(const JsonValue &root) {
  const JsonArray *layers = root["layers"].tryAsArray();
  if (layers == nullptr) {
    OVERMAP_ERROR(std::format("Overmap tile '{}' has no layers array",
                              m_sourceFile));
    clear();
    return false;
  }

  if (layers->size() > static_cast<size_t>(Z_LEVEL_COUNT)) {
    OVERMAP_WARN(std::format("Overmap tile '{}' has {} layers, ignoring all "
                             "above z={}",
                             m_sourceFile, layers->size(), MAX_Z_LEVEL));
  } else if (layers->size() < static_cast<size_t>(Z_LEVEL_COUNT)) {
    OVERMAP_INFO(std::format("Overmap tile '{}' has {} layers, levels above "
                             "z={} stay empty",
                             m_sourceFile, layers->size(),
                             MIN_Z_LEVEL + static_cast<int>(layers->size()) - 1));
  }

  const size_t levelCount =
      std::min(layers->size(), static_cast<size_t>(Z_LEVEL_COUNT));
  for (size_t i = 0; i < levelCount; ++i) {
    if (!decodeLayer((*layers)[i], MIN_Z_LEVEL + static_cast<int>(i))) {
      clear();
      return false;
    }
  }

  OVERMAP_DEBUG(std::format("Decoded overmap tile '{}' with {} terrain types",
                            m_sourceFile, m_types.size()));
  return true;
}

bool OvermapTile::decodeLayer(const JsonValue &layer, int z) {
  const JsonArray *runs = layer.tryAsArray();
  if (runs == nullptr) {
    OVERMAP_ERROR(std::format("Layer z={} of '{}' is not an array", z,
                              m_sourceFile));
    return false;
  }

  auto &cells = m_layers[z - MIN_Z_LEVEL];
  cells.reserve(OMT_CELL_COUNT);
  size_t clippedCells = 0;

  for (const auto &run : *runs) {
    const JsonValue &typeValue = run[RUN_TYPE_SLOT];
    const JsonValue &lengthValue = run[RUN_LENGTH_SLOT];
    if (run.size() != 2 || !typeValue.isString() || !lengthValue.isNumber()) {
      OVERMAP_ERROR(std::format("Malformed run {} in layer z={} of '{}'",
                                run.toString(), z, m_sourceFile));
      return false;
    }

    const double length = lengthValue.asNumber();
    if (length < 0.0 || std::floor(length) != length) {
      OVERMAP_ERROR(std::format("Invalid run length {} in layer z={} of '{}'",
                                length, z, m_sourceFile));
      return false;
    }

    const size_t remaining = OMT_CELL_COUNT - cells.size();
    size_t count = remaining;
    if (length <= static_cast<double>(remaining)) {
      count = static_cast<size_t>(length);
    } else {
      clippedCells += static_cast<size_t>(
          std::min(length - static_cast<double>(remaining), 1e15));
    }
    if (count == 0) {
      continue;
    }

    const uint32_t typeIndex = internType(typeValue.asString());
    cells.insert(cells.end(), count, typeIndex);
  }

  if (clippedCells > 0) {
    OVERMAP_WARN(std::format("Layer z={} of '{}' overflows the tile by {} "
                             "cells, extra cells dropped",
                             z, m_sourceFile, clippedCells));
  }
  return true;
}

uint32_t OvermapTile::internType(const std::string &omtype) {
  auto [it, inserted] =
      m_typeIndex.try_emplace(omtype, static_cast<uint32_t>(m_types.size()));
  if (inserted) {
    m_types.push_back(TerrainType{omtype, {}, std::nullopt});
  }
  return it->second;
}

bool OvermapTile::resolveSymbols(const DefinitionStore &store) {
  const CategoryStore *terrain = store.getCategory(OVERMAP_TERRAIN_CATEGORY);
  if (terrain == nullptr) {
    OVERMAP_ERROR("overmap_terrain not loaded");
    return false;
  }
  OVERMAP_DEBUG(std::format("Resolving {} terrain types against {} "
                            "overmap_terrain definitions",
                            m_types.size(), terrain->size()));

  for (auto &type : m_types) {
    resolveType(type, *terrain);
  }

  const size_t unmatched = getUnmatchedTypeCount();
  if (unmatched > 0) {
    OVERMAP_INFO(std::format("{} of {} terrain types in '{}' have no "
                             "overmap_terrain definition",
                             unmatched, m_types.size(), m_sourceFile));
  }
  return true;
}

void OvermapTile::resolveType(TerrainType &type,
                              const CategoryStore &terrain) const {
  type.terrain.reset();
  type.glyph.reset();

  // Roads, rivers and other linear features carry their connectivity in the suffix
  if (const LinearSuffix *linear = matchLinearSuffix(type.omtype)) {
    const std::string base(stripSuffix(type.omtype, linear->suffix));
    if (DefinitionPtr definition = terrain.find(base)) {
      if (definition->hasFlag(LINEAR_FLAG)) {
        type.terrain = definition;
        type.glyph = std::string(linear->glyph);
        return;
      }
    } else {
      OVERMAP_DEBUG("No matching overmap_terrain for " + base);
    }
  }

  const CompassSuffix *compass = matchCompassSuffix(type.omtype);
  const std::string base(compass != nullptr
                             ? stripSuffix(type.omtype, compass->suffix)
                             : std::string_view(type.omtype));
  DefinitionPtr definition = terrain.find(base);
  if (!definition) {
    OVERMAP_WARN("Failed to get overmap_terrain for " + base);
    return;
  }
  type.terrain = definition;

  const std::optional<std::string> sym = definition->getString(SYM_KEY);
  if (!sym) {
    return;
  }

  if (*sym == POINTER_GLYPH) {
    if (compass != nullptr) {
      type.glyph = std::string(compass->pointerGlyph);
    } else {
      OVERMAP_WARN("No direction suffix on pointer terrain " + type.omtype);
    }
  } else if (auto connections = connectionsForGlyph(*sym)) {
    const int distance =
        compass != nullptr ? rotationDistance(compass->direction) : 0;
    if (auto rotated =
            glyphForConnections(rotateConnections(*connections, distance))) {
      type.glyph = std::string(*rotated);
    }
  }
}

std::optional<OvermapCell> OvermapTile::getTile(int x, int y, int z) const {
  if (!isInBounds(x, y) || !isValidZLevel(z)) {
    return std::nullopt;
  }

  const auto &cells = m_layers[z - MIN_Z_LEVEL];
  const size_t index = static_cast<size_t>(localToIndex(x, y));
  if (index >= cells.size()) {
    return std::nullopt;
  }

  const TerrainType &type = m_types[cells[index]];
  return OvermapCell{x, y, z, type.omtype, type.terrain, type.glyph};
}

bool OvermapTile::hasTile(int x, int y, int z) const {
  return isInBounds(x, y) && isValidZLevel(z) &&
         static_cast<size_t>(localToIndex(x, y)) <
             m_layers[z - MIN_Z_LEVEL].size();
}

size_t OvermapTile::getCellCount(int z) const {
  if (!isValidZLevel(z)) {
    return 0;
  }
  return m_layers[z - MIN_Z_LEVEL].size();
}

size_t OvermapTile::getUnmatchedTypeCount() const {
  return static_cast<size_t>(
      std::count_if(m_types.begin(), m_types.end(),
                    [](const TerrainType &type) { return type.terrain.expired(); }));
}

} // namespace OvermapAtlas
