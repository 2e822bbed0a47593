/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "gamedata/Definition.hpp"
#include <algorithm>
#include <utility>

namespace OvermapAtlas {

Definition::Definition(std::string category, std::string id, JsonObject fields,
                       std::string sourceFile)
    : m_category(std::move(category)), m_id(std::move(id)),
      m_fields(std::move(fields)), m_sourceFile(std::move(sourceFile)) {}

bool Definition::hasField(const std::string &key) const {
  return m_fields.find(key) != m_fields.end();
}

const JsonValue &Definition::getField(const std::string &key) const {
  static const JsonValue null_value;
  auto it = m_fields.find(key);
  return it != m_fields.end() ? it->second : null_value;
}

std::optional<std::string> Definition::getString(const std::string &key) const {
  return getField(key).tryAsString();
}

bool Definition::hasFlag(const std::string &flag) const {
  const JsonArray *flags = getField(KEY_FLAGS).tryAsArray();
  if (flags == nullptr) {
    return false;
  }
  return std::any_of(flags->begin(), flags->end(), [&flag](const JsonValue &v) {
    return v.isString() && v.asString() == flag;
  });
}

std::optional<std::string> Definition::copyFrom() const {
  if (auto parent = getString(KEY_COPY_FROM)) {
    return parent;
  }
  return getString(KEY_COPY_FROM_ALT);
}

bool Definition::isAbstract() const {
  const JsonValue &marker = getField(KEY_ABSTRACT);
  if (marker.isBool()) {
    return marker.asBool();
  }
  // The game spells abstract templates as "abstract": "<template id>"
  return marker.isString();
}

} // namespace OvermapAtlas
