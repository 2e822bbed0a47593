/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "overmap/LineGlyphs.hpp"

namespace OvermapAtlas {

namespace {

// "_<suffix>" at the very end of omtype
bool endsWithSuffix(std::string_view omtype, std::string_view suffix) {
  return omtype.size() > suffix.size() && omtype.ends_with(suffix) &&
         omtype[omtype.size() - suffix.size() - 1] == '_';
}

} // namespace

const LinearSuffix *matchLinearSuffix(std::string_view omtype) {
  const LinearSuffix *best = nullptr;
  for (const auto &entry : LINEAR_SUFFIXES) {
    if (endsWithSuffix(omtype, entry.suffix) &&
        (best == nullptr || entry.suffix.size() > best->suffix.size())) {
      best = &entry;
    }
  }
  return best;
}

const CompassSuffix *matchCompassSuffix(std::string_view omtype) {
  for (const auto &entry : COMPASS_SUFFIXES) {
    if (endsWithSuffix(omtype, entry.suffix)) {
      return &entry;
    }
  }
  return nullptr;
}

std::string_view stripSuffix(std::string_view omtype, std::string_view suffix) {
  if (!endsWithSuffix(omtype, suffix)) {
    return omtype;
  }
  return omtype.substr(0, omtype.size() - suffix.size() - 1);
}

std::string_view pointerGlyph(Compass direction) {
  for (const auto &entry : COMPASS_SUFFIXES) {
    if (entry.direction == direction) {
      return entry.pointerGlyph;
    }
  }
  return POINTER_GLYPH;
}

std::optional<uint8_t> connectionsForGlyph(std::string_view glyph) {
  for (const auto &entry : LINEAR_SUFFIXES) {
    if (entry.glyph == glyph) {
      return entry.connections;
    }
  }
  return std::nullopt;
}

std::optional<std::string_view> glyphForConnections(uint8_t connections) {
  for (const auto &entry : LINEAR_SUFFIXES) {
    if (entry.connections == connections) {
      return entry.glyph;
    }
  }
  return std::nullopt;
}

} // namespace OvermapAtlas
