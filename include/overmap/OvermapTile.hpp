/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OVERMAP_TILE_HPP
#define OVERMAP_TILE_HPP

#include "gamedata/Definition.hpp"
#include "overmap/OvermapConstants.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace OvermapAtlas {

class CategoryStore;
class DefinitionStore;

/**
 * @brief One decoded overmap cell.
 *
 * The terrain definition is borrowed from the DefinitionStore that resolved
 * the tile and expires with it.
 */
struct OvermapCell {
  int x{0};
  int y{0};
  int z{0};
  std::string omtype;
  std::weak_ptr<const Definition> terrain;
  std::optional<std::string> glyph; // overrides the terrain's sym

  DefinitionPtr getTerrain() const { return terrain.lock(); }
};

/**
 * @brief A 180x180 overmap tile with 21 z-levels decoded from a save file.
 *
 * Cells sharing a type string share one resolved type record, so resolving
 * a tile costs one lookup per distinct type rather than one per cell.
 *
 * Usage:
 *   OvermapTile tile(0, 0);
 *   if (tile.loadFromFile(savePath + "/o.0.0")) {
 *     tile.resolveSymbols(store);
 *     auto cell = tile.getTile(12, 40, 0);
 *   }
 */
class OvermapTile {
public:
  explicit OvermapTile(int overX = 0, int overY = 0);

  // Overmap coordinates from a save file name of the form o.<x>.<y>
  static std::optional<std::pair<int, int>>
  coordsFromFilename(const std::string &path);

  // Reads and decodes a save file; a leading '#' line is skipped
  bool loadFromFile(const std::string &path);
  bool parse(const std::string &json, const std::string &sourceName);

  /**
   * @brief Attaches overmap_terrain definitions and glyph overrides.
   * @return false only when the store holds no overmap_terrain category
   */
  bool resolveSymbols(const DefinitionStore &store);

  std::optional<OvermapCell> getTile(int x, int y, int z = 0) const;
  bool hasTile(int x, int y, int z = 0) const;

  // Decoded cells on a level, counted in row-major order from (0, 0)
  size_t getCellCount(int z) const;
  size_t getTypeCount() const { return m_types.size(); }
  size_t getUnmatchedTypeCount() const;

  int getOverX() const { return m_overX; }
  int getOverY() const { return m_overY; }
  const std::string &getSourceFile() const { return m_sourceFile; }

private:
  struct TerrainType {
    std::string omtype;
    std::weak_ptr<const Definition> terrain;
    std::optional<std::string> glyph;
  };

  int m_overX;
  int m_overY;
  std::string m_sourceFile;
  std::vector<TerrainType> m_types;
  std::unordered_map<std::string, uint32_t> m_typeIndex;
  // Per level, the type index of each decoded cell; index 0 is MIN_Z_LEVEL
  std::array<std::vector<uint32_t>, Z_LEVEL_COUNT> m_layers;

  void clear();
  bool decodeLayers(const JsonValue &root);
  bool decodeLayer(const JsonValue &layer, int z);
  uint32_t internType(const std::string &omtype);
  void resolveType(TerrainType &type, const CategoryStore &terrain) const;
};

} // namespace OvermapAtlas

#endif // OVERMAP_TILE_HPP
