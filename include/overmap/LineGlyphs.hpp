/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef LINE_GLYPHS_HPP
#define LINE_GLYPHS_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace OvermapAtlas {

/**
 * Connectivity bitmask of a line-drawing glyph. One bit per side, ordered so
 * that a left rotation by one turns every connection a quarter counter-
 * clockwise (north -> west -> south -> east -> north).
 */
enum ConnectionBits : uint8_t {
  CONNECT_WEST = 0b0001,
  CONNECT_SOUTH = 0b0010,
  CONNECT_EAST = 0b0100,
  CONNECT_NORTH = 0b1000,
  CONNECT_ALL = 0b1111
};

// Connectivity suffix of linear terrain ("road_ns", "river_end_west", ...)
struct LinearSuffix {
  std::string_view suffix;
  std::string_view glyph;
  std::string_view name;
  uint8_t connections;
};

inline constexpr std::array<LinearSuffix, 16> LINEAR_SUFFIXES{{
  {"end_south", "│", "VLINE", CONNECT_NORTH | CONNECT_SOUTH},
  {"end_north", "│", "VLINE", CONNECT_NORTH | CONNECT_SOUTH},
  {"ns", "│", "VLINE", CONNECT_NORTH | CONNECT_SOUTH},
  {"end_west", "─", "HLINE", CONNECT_EAST | CONNECT_WEST},
  {"end_east", "─", "HLINE", CONNECT_EAST | CONNECT_WEST},
  {"ew", "─", "HLINE", CONNECT_EAST | CONNECT_WEST},
  {"ne", "└", "LLCORNER", CONNECT_NORTH | CONNECT_EAST},
  {"es", "┌", "ULCORNER", CONNECT_EAST | CONNECT_SOUTH},
  {"sw", "┐", "URCORNER", CONNECT_SOUTH | CONNECT_WEST},
  {"wn", "┘", "LRCORNER", CONNECT_NORTH | CONNECT_WEST},
  {"nes", "├", "LTEE", CONNECT_NORTH | CONNECT_EAST | CONNECT_SOUTH},
  {"new", "┴", "BTEE", CONNECT_NORTH | CONNECT_EAST | CONNECT_WEST},
  {"nsw", "┤", "RTEE", CONNECT_NORTH | CONNECT_SOUTH | CONNECT_WEST},
  {"esw", "┬", "TTEE", CONNECT_EAST | CONNECT_SOUTH | CONNECT_WEST},
  {"isolated", "┼", "PLUS", CONNECT_ALL},
  {"nesw", "┼", "PLUS", CONNECT_ALL},
}};

// Listed in rotation-distance order: the enum value is the quarter turns from north
enum class Compass : uint8_t { North = 0, West = 1, South = 2, East = 3 };

struct CompassSuffix {
  std::string_view suffix;
  Compass direction;
  std::string_view pointerGlyph;
};

inline constexpr std::array<CompassSuffix, 4> COMPASS_SUFFIXES{{
  {"north", Compass::North, "^"},
  {"west", Compass::West, "<"},
  {"south", Compass::South, "v"},
  {"east", Compass::East, ">"},
}};

// Default glyph of buildings whose entrance faces the stored direction
inline constexpr std::string_view POINTER_GLYPH = "^";

constexpr int rotationDistance(Compass direction) {
  return static_cast<int>(direction);
}

/**
 * Rotate a 4-bit connectivity mask left by distance quarter turns, wrapping
 * bits that leave bit 3 back into bit 0. Distances are taken modulo 4.
 */
constexpr uint8_t rotateConnections(uint8_t mask, int distance) {
  const unsigned bits = mask & CONNECT_ALL;
  const int shift = ((distance % 4) + 4) % 4;
  const unsigned shifted = bits << shift;
  return static_cast<uint8_t>((shifted & 0b1111) | ((shifted & 0b11110000) >> 4));
}

// Longest linear suffix preceded by '_' at the end of omtype, if any
const LinearSuffix* matchLinearSuffix(std::string_view omtype);

const CompassSuffix* matchCompassSuffix(std::string_view omtype);

// omtype without "_<suffix>"; callers pass a suffix returned by a matcher
std::string_view stripSuffix(std::string_view omtype, std::string_view suffix);

std::string_view pointerGlyph(Compass direction);

// Connectivity of a line-drawing glyph; empty for any other glyph
std::optional<uint8_t> connectionsForGlyph(std::string_view glyph);

// First line-drawing glyph with the given connectivity; empty if none
std::optional<std::string_view> glyphForConnections(uint8_t connections);

inline bool isLineGlyph(std::string_view glyph) {
  return connectionsForGlyph(glyph).has_value();
}

} // namespace OvermapAtlas

#endif // LINE_GLYPHS_HPP
