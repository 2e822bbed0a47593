/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DEFINITION_HPP
#define DEFINITION_HPP

#include "utils/JsonReader.hpp"
#include <memory>
#include <optional>
#include <string>

namespace OvermapAtlas {

// Content keys with meaning to the loader and the inheritance resolver
inline constexpr const char *KEY_TYPE = "type";
inline constexpr const char *KEY_ID = "id";
inline constexpr const char *KEY_ABSTRACT = "abstract";
inline constexpr const char *KEY_COPY_FROM = "copy-from";
inline constexpr const char *KEY_COPY_FROM_ALT = "copy_from";
inline constexpr const char *KEY_FLAGS = "flags";

/**
 * @brief One content record from the game's JSON database.
 *
 * A definition belongs to exactly one category (its "type") and, for indexed
 * categories, is addressed by its id. Abstract definitions carry their id in
 * the "abstract" key and exist only to be inherited from.
 */
class Definition {
public:
  Definition(std::string category, std::string id, JsonObject fields,
             std::string sourceFile);

  const std::string &getCategory() const { return m_category; }
  const std::string &getId() const { return m_id; }
  const std::string &getSourceFile() const { return m_sourceFile; }
  const JsonObject &getFields() const { return m_fields; }

  bool hasField(const std::string &key) const;
  const JsonValue &getField(const std::string &key) const;

  // Empty optional when the key is absent or not a string
  std::optional<std::string> getString(const std::string &key) const;

  // True when the "flags" array contains flag
  bool hasFlag(const std::string &flag) const;

  // Parent id named by "copy-from" (or its "copy_from" spelling)
  std::optional<std::string> copyFrom() const;

  bool isAbstract() const;

private:
  std::string m_category;
  std::string m_id;
  JsonObject m_fields;
  std::string m_sourceFile;
};

using DefinitionPtr = std::shared_ptr<const Definition>;

} // namespace OvermapAtlas

#endif // DEFINITION_HPP
