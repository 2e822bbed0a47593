/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DEFINITION_STORE_HPP
#define DEFINITION_STORE_HPP

#include "gamedata/Definition.hpp"
#include <boost/container/flat_map.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace OvermapAtlas {

/**
 * @brief How a category keeps its definitions.
 *
 * Indexed categories key definitions by id and take part in copy-from
 * resolution. Sequential categories (map generators and friends) have no
 * ids and simply accumulate in load order.
 */
enum class StorageShape : uint8_t { Indexed, Sequential };

/**
 * @brief Counters collected while loading and resolving content.
 *
 * None of these conditions aborts a load; callers decide what is fatal.
 */
struct LoadReport {
  size_t filesLoaded{0};
  size_t filesFailed{0};
  size_t definitionsLoaded{0};
  size_t untypedObjects{0};
  size_t missingIds{0};
  size_t collisions{0};
  size_t resolvedChains{0};
  size_t missingDependencies{0};
  size_t cycles{0};
  size_t truncatedChains{0};
};

class CategoryStore {
public:
  using IndexMap = boost::container::flat_map<std::string, DefinitionPtr>;

  CategoryStore(std::string name, StorageShape shape);

  const std::string &getName() const { return m_name; }
  StorageShape getShape() const { return m_shape; }
  size_t size() const;

  // Null for unknown ids and for sequential categories
  DefinitionPtr find(const std::string &id) const;

  const IndexMap &getIndexed() const { return m_byId; }
  const std::vector<DefinitionPtr> &getSequence() const { return m_sequence; }

private:
  friend class DefinitionStore;

  std::string m_name;
  StorageShape m_shape;
  IndexMap m_byId;
  std::vector<DefinitionPtr> m_sequence;
};

/**
 * @brief Loads the game's JSON content database and flattens copy-from chains.
 *
 * Every instance owns its own categories. Loading and resolve() must finish
 * before the store is shared with readers; after that it is read-only.
 *
 * Usage:
 *   DefinitionStore store;
 *   store.load(ResourcePath::gameDataDir(gamePath));
 *   store.resolve();
 *   DefinitionPtr field = store.find("overmap_terrain", "field");
 */
class DefinitionStore {
public:
  static constexpr size_t MAX_INHERITANCE_DEPTH = 16;

  static const std::vector<std::string> &defaultDirectories();
  static StorageShape shapeForCategory(const std::string &category);

  DefinitionStore() = default;

  DefinitionStore(const DefinitionStore &) = delete;
  DefinitionStore &operator=(const DefinitionStore &) = delete;
  DefinitionStore(DefinitionStore &&) = default;
  DefinitionStore &operator=(DefinitionStore &&) = default;

  /**
   * @brief Recursively loads every *.json file under jsonRoot/<directory>
   *
   * Files of a directory are read before its subdirectories, in name order.
   * @return Number of files that failed to load (zero on success)
   */
  size_t load(const std::filesystem::path &jsonRoot,
              const std::vector<std::string> &directories = defaultDirectories());

  bool loadFile(const std::filesystem::path &path);
  bool loadString(const std::string &json, const std::string &sourceName);

  /**
   * @brief Flattens copy-from chains in two passes: abstract templates first,
   * then concrete definitions.
   *
   * Every chain is walked over the definitions as loaded, so the result
   * does not depend on id order. Call once, after all loading is done.
   */
  void resolve();

  DefinitionPtr find(const std::string &category, const std::string &id) const;
  bool hasCategory(const std::string &category) const;

  // Null when the category was never loaded
  const CategoryStore *getCategory(const std::string &category) const;

  std::vector<std::string> getCategoryNames() const;
  size_t getDefinitionCount() const;
  const LoadReport &getReport() const { return m_report; }

private:
  boost::container::flat_map<std::string, CategoryStore> m_categories;
  LoadReport m_report;

  size_t loadDirectory(const std::filesystem::path &directory);
  void insertRoot(JsonValue root, const std::string &sourceName);
  void insertObject(JsonObject &&object, const std::string &sourceFile);
  void insertIndexed(CategoryStore &store, const std::string &id,
                     DefinitionPtr definition);
  CategoryStore &categoryFor(const std::string &category);

  void resolvePass(CategoryStore &store, const CategoryStore::IndexMap &unresolved,
                   bool abstractPass);
  DefinitionPtr flatten(const CategoryStore::IndexMap &unresolved,
                        const Definition &child);
};

} // namespace OvermapAtlas

#endif // DEFINITION_STORE_HPP
