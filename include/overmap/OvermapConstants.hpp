/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef OVERMAP_CONSTANTS_HPP
#define OVERMAP_CONSTANTS_HPP

#include <iostream>

namespace OvermapAtlas {

// Overmap tile size in cells (X and Y)
constexpr int OMT_SIZE = 180;
constexpr int OMT_CELL_COUNT = OMT_SIZE * OMT_SIZE;

// Overmap tiles per map segment directory
constexpr int SEGMENT_SIZE = 32;

// Vertical band stored in every overmap tile file, lowest level first
constexpr int MIN_Z_LEVEL = -10;
constexpr int MAX_Z_LEVEL = 10;
constexpr int Z_LEVEL_COUNT = MAX_Z_LEVEL - MIN_Z_LEVEL + 1;

struct LocalCoord {
  int x;
  int y;

  bool operator==(const LocalCoord& other) const = default;
};

struct SegmentCoord {
  int x;
  int y;
  int z;

  bool operator==(const SegmentCoord& other) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const LocalCoord& coord) {
  return os << '<' << coord.x << ", " << coord.y << '>';
}

inline std::ostream& operator<<(std::ostream& os, const SegmentCoord& coord) {
  return os << '<' << coord.x << ", " << coord.y << ", " << coord.z << '>';
}

constexpr bool isInBounds(int x, int y) {
  return x >= 0 && x < OMT_SIZE && y >= 0 && y < OMT_SIZE;
}

constexpr bool isValidZLevel(int z) {
  return z >= MIN_Z_LEVEL && z <= MAX_Z_LEVEL;
}

// Row-major cell index within a tile
constexpr LocalCoord indexToLocal(int index) {
  return {index % OMT_SIZE, index / OMT_SIZE};
}

constexpr int localToIndex(int x, int y) {
  return y * OMT_SIZE + x;
}

// Floor division so negative overmap coordinates land in the right segment
constexpr SegmentCoord overmapToSegment(int x, int y, int z) {
  auto floorDiv = [](int v, int m) { return v >= 0 ? v / m : (v - m + 1) / m; };
  return {floorDiv(x, SEGMENT_SIZE), floorDiv(y, SEGMENT_SIZE), z};
}

} // namespace OvermapAtlas

#endif // OVERMAP_CONSTANTS_HPP
