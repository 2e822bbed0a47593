/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GRID_PROJECTOR_HPP
#define GRID_PROJECTOR_HPP

#include <optional>
#include <string>
#include <vector>

namespace OvermapAtlas {

class OvermapTile;

struct ProjectedCell {
  std::string glyph;
  std::string color; // empty when the definition names none
  std::string name;
  std::optional<std::string> id;

  bool operator==(const ProjectedCell &other) const = default;
};

// Indexed [y][x]
using OvermapGrid = std::vector<std::vector<ProjectedCell>>;

/**
 * @brief Projects one z-level of a resolved overmap tile to a display grid.
 */
class GridProjector {
public:
  static const ProjectedCell &unexploredCell();
  static const ProjectedCell &unknownTerrainCell();
  static const ProjectedCell &missingSymbolCell();

  static OvermapGrid project(const OvermapTile &tile, int z = 0);

  // One line per row, every row newline-terminated
  static std::string toText(const OvermapGrid &grid);
};

} // namespace OvermapAtlas

#endif // GRID_PROJECTOR_HPP
