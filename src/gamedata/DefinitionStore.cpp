/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "gamedata/DefinitionStore.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace OvermapAtlas {

namespace fs = std::filesystem;

namespace {

// Categories without ids or inheritance; everything else is indexed by id
const std::unordered_set<std::string> SEQUENTIAL_CATEGORIES{
    "mapgen", "monstergroup", "snippet"};

// Keys that identify a definition rather than describe it
bool isIdentityKey(const std::string &key) {
  return key == KEY_ID || key == KEY_ABSTRACT || key == KEY_COPY_FROM ||
         key == KEY_COPY_FROM_ALT;
}

std::string joinChain(const std::vector<std::string> &ids) {
  std::string chain;
  for (const auto &id : ids) {
    if (!chain.empty()) {
      chain += "->";
    }
    chain += id;
  }
  return chain;
}

} // namespace

// CategoryStore implementation
CategoryStore::CategoryStore(std::string name, StorageShape shape)
    : m_name(std::move(name)), m_shape(shape) {}

size_t CategoryStore::size() const {
  return m_shape == StorageShape::Indexed ? m_byId.size() : m_sequence.size();
}

DefinitionPtr CategoryStore::find(const std::string &id) const {
  auto it = m_byId.find(id);
  return it != m_byId.end() ? it->second : nullptr;
}

// DefinitionStore implementation
const std::vector<std::string> &DefinitionStore::defaultDirectories() {
  static const std::vector<std::string> directories{"mapgen", "overmap"};
  return directories;
}

StorageShape DefinitionStore::shapeForCategory(const std::string &category) {
  return SEQUENTIAL_CATEGORIES.count(category) != 0 ? StorageShape::Sequential
                                                    : StorageShape::Indexed;
}

size_t DefinitionStore::load(const fs::path &jsonRoot,
                             const std::vector<std::string> &directories) {
  size_t failed = 0;
  for (const auto &directory : directories) {
    fs::path basePath = jsonRoot / directory;
    GAMEDATA_DEBUG(std::format("loading {} [{}]", directory, basePath.string()));

    std::error_code ec;
    if (!fs::is_directory(basePath, ec)) {
      GAMEDATA_WARN(std::format("content directory not found: {}", basePath.string()));
      continue;
    }
    failed += loadDirectory(basePath);
  }

  GAMEDATA_INFO(std::format("loaded {} definitions from {} files ({} failed)",
                            m_report.definitionsLoaded, m_report.filesLoaded,
                            m_report.filesFailed));
  return failed;
}

size_t DefinitionStore::loadDirectory(const fs::path &directory) {
  std::vector<fs::path> files;
  std::vector<fs::path> subdirectories;

  std::error_code ec;
  for (fs::directory_iterator it(directory, ec), end; !ec && it != end;
       it.increment(ec)) {
    const fs::directory_entry &entry = *it;
    std::error_code typeEc;
    if (entry.is_directory(typeEc) && !entry.is_symlink(typeEc)) {
      subdirectories.push_back(entry.path());
    } else if (entry.is_regular_file(typeEc) &&
               entry.path().extension() == ".json") {
      files.push_back(entry.path());
    }
  }
  if (ec) {
    GAMEDATA_ERROR(std::format("failed to read directory {}: {}",
                               directory.string(), ec.message()));
    return 0;
  }

  std::sort(files.begin(), files.end());
  std::sort(subdirectories.begin(), subdirectories.end());

  GAMEDATA_DEBUG(std::format("enter: {} ({} files, {} subdirs)", directory.string(),
                             files.size(), subdirectories.size()));

  size_t failed = 0;
  for (const auto &file : files) {
    if (!loadFile(file)) {
      ++failed;
    }
  }
  for (const auto &subdirectory : subdirectories) {
    failed += loadDirectory(subdirectory);
  }
  return failed;
}

bool DefinitionStore::loadFile(const fs::path &path) {
  GAMEDATA_DEBUG("parsing " + path.string());

  JsonReader reader;
  if (!reader.loadFromFile(path.string())) {
    GAMEDATA_ERROR(std::format("failed to load {}: {}", path.string(),
                               reader.getLastError()));
    ++m_report.filesFailed;
    return false;
  }

  insertRoot(reader.takeRoot(), path.string());
  return true;
}

bool DefinitionStore::loadString(const std::string &json,
                                 const std::string &sourceName) {
  JsonReader reader;
  if (!reader.parse(json)) {
    GAMEDATA_ERROR(std::format("failed to parse {}: {}", sourceName,
                               reader.getLastError()));
    ++m_report.filesFailed;
    return false;
  }

  insertRoot(reader.takeRoot(), sourceName);
  return true;
}

void DefinitionStore::insertRoot(JsonValue root, const std::string &sourceName) {
  ++m_report.filesLoaded;

  // A file holds either a single object or a list of them
  if (root.isObject()) {
    insertObject(std::move(root.asObject()), sourceName);
  } else if (root.isArray()) {
    for (auto &element : root.asArray()) {
      if (!element.isObject()) {
        GAMEDATA_WARN(std::format("{}: skipping non-object array element", sourceName));
        continue;
      }
      insertObject(std::move(element.asObject()), sourceName);
    }
  } else {
    GAMEDATA_WARN(std::format("{}: root is neither an object nor an array", sourceName));
  }
}

CategoryStore &DefinitionStore::categoryFor(const std::string &category) {
  auto it = m_categories.find(category);
  if (it == m_categories.end()) {
    it = m_categories
             .emplace(category, CategoryStore(category, shapeForCategory(category)))
             .first;
  }
  return it->second;
}

void DefinitionStore::insertObject(JsonObject &&object,
                                   const std::string &sourceFile) {
  auto typeIt = object.find(KEY_TYPE);
  if (typeIt == object.end() || !typeIt->second.isString() ||
      typeIt->second.asString().empty()) {
    GAMEDATA_WARN(std::format("'type' not defined in {}", sourceFile));
    ++m_report.untypedObjects;
    return;
  }
  std::string category = typeIt->second.asString();
  CategoryStore &store = categoryFor(category);

  if (store.getShape() == StorageShape::Sequential) {
    store.m_sequence.push_back(std::make_shared<const Definition>(
        category, std::string(), std::move(object), sourceFile));
    ++m_report.definitionsLoaded;
    return;
  }

  // The game allows one object to define several ids at once
  std::vector<std::string> ids;
  static const JsonValue null_value;
  auto idIt = object.find(KEY_ID);
  auto abstractIt = object.find(KEY_ABSTRACT);
  const JsonValue &idValue = idIt != object.end() ? idIt->second : null_value;
  const JsonValue &abstractValue =
      abstractIt != object.end() ? abstractIt->second : null_value;
  if (idValue.isString() && !idValue.asString().empty()) {
    ids.push_back(idValue.asString());
  } else if (const JsonArray *idList = idValue.tryAsArray()) {
    for (const auto &id : *idList) {
      if (id.isString() && !id.asString().empty()) {
        ids.push_back(id.asString());
      }
    }
  } else if (auto abstractId = abstractValue.tryAsString()) {
    ids.push_back(*abstractId);
  }

  if (ids.empty()) {
    GAMEDATA_WARN(std::format("{}: expected 'id' field for type {}, but none defined",
                              sourceFile, category));
    ++m_report.missingIds;
    return;
  }

  for (size_t i = 0; i + 1 < ids.size(); ++i) {
    insertIndexed(store, ids[i],
                  std::make_shared<const Definition>(category, ids[i], object, sourceFile));
  }
  insertIndexed(store, ids.back(),
                std::make_shared<const Definition>(category, ids.back(),
                                                   std::move(object), sourceFile));
}

void DefinitionStore::insertIndexed(CategoryStore &store, const std::string &id,
                                    DefinitionPtr definition) {
  auto [it, inserted] = store.m_byId.try_emplace(id, definition);
  if (!inserted) {
    GAMEDATA_WARN(std::format("{}: type={} id={} already exists (from {}), but redefining!",
                              definition->getSourceFile(), store.getName(), id,
                              it->second->getSourceFile()));
    ++m_report.collisions;
    it->second = std::move(definition);
  }
  ++m_report.definitionsLoaded;
}

void DefinitionStore::resolve() {
  // Chains are walked over the definitions as loaded, so a merge never
  // reaches through an ancestor that an earlier merge already flattened
  boost::container::flat_map<std::string, CategoryStore::IndexMap> unresolved;
  for (const auto &[category, store] : m_categories) {
    if (store.getShape() == StorageShape::Indexed) {
      unresolved.emplace(category, store.m_byId);
    }
  }

  for (int pass = 1; pass <= 2; ++pass) {
    GAMEDATA_DEBUG(std::format("resolving dependencies in gamedata: pass {}", pass));
    for (auto &[category, store] : m_categories) {
      if (store.getShape() == StorageShape::Sequential) {
        GAMEDATA_DEBUG(std::format("skipping type '{}'", category));
        continue;
      }
      resolvePass(store, unresolved.at(category), pass == 1);
    }
  }

  GAMEDATA_INFO(std::format("resolved {} copy-from chains ({} missing dependencies, {} cycles)",
                            m_report.resolvedChains, m_report.missingDependencies,
                            m_report.cycles));
}

void DefinitionStore::resolvePass(CategoryStore &store,
                                  const CategoryStore::IndexMap &unresolved,
                                  bool abstractPass) {
  for (auto &[id, definition] : store.m_byId) {
    const DefinitionPtr &original = unresolved.at(id);
    if (original->isAbstract() != abstractPass || !original->copyFrom()) {
      continue;
    }
    if (DefinitionPtr merged = flatten(unresolved, *original)) {
      definition = std::move(merged);
      ++m_report.resolvedChains;
    }
  }
}

DefinitionPtr DefinitionStore::flatten(const CategoryStore::IndexMap &unresolved,
                                       const Definition &child) {
  std::vector<DefinitionPtr> ancestors;
  std::vector<std::string> chain{child.getId()};

  std::optional<std::string> parentId = child.copyFrom();
  while (parentId) {
    if (ancestors.size() >= MAX_INHERITANCE_DEPTH) {
      GAMEDATA_DEBUG(std::format("{}: copy-from chain truncated after {} levels",
                                 child.getId(), MAX_INHERITANCE_DEPTH));
      ++m_report.truncatedChains;
      break;
    }
    if (std::find(chain.begin(), chain.end(), *parentId) != chain.end()) {
      GAMEDATA_ERROR(std::format("{}: copy-from cycle {}->{}", child.getId(),
                                 joinChain(chain), *parentId));
      ++m_report.cycles;
      break;
    }

    auto parentIt = unresolved.find(*parentId);
    if (parentIt == unresolved.end()) {
      GAMEDATA_ERROR(std::format("{}: missing copy-from dependency '{}'",
                                 chain.back(), *parentId));
      ++m_report.missingDependencies;
      break;
    }

    ancestors.push_back(parentIt->second);
    chain.push_back(*parentId);
    parentId = parentIt->second->copyFrom();
  }

  if (ancestors.empty()) {
    return nullptr;
  }

  GAMEDATA_DEBUG("resolve deps: " + joinChain(chain));

  // Furthest ancestor first so nearer definitions overwrite its fields
  JsonObject merged;
  for (auto it = ancestors.rbegin(); it != ancestors.rend(); ++it) {
    for (const auto &[key, value] : (*it)->getFields()) {
      if (!isIdentityKey(key)) {
        merged.insert_or_assign(key, value);
      }
    }
  }
  for (const auto &[key, value] : child.getFields()) {
    merged.insert_or_assign(key, value);
  }

  return std::make_shared<const Definition>(child.getCategory(), child.getId(),
                                            std::move(merged), child.getSourceFile());
}

DefinitionPtr DefinitionStore::find(const std::string &category,
                                    const std::string &id) const {
  const CategoryStore *store = getCategory(category);
  return store != nullptr ? store->find(id) : nullptr;
}

bool DefinitionStore::hasCategory(const std::string &category) const {
  return m_categories.find(category) != m_categories.end();
}

const CategoryStore *DefinitionStore::getCategory(const std::string &category) const {
  auto it = m_categories.find(category);
  return it != m_categories.end() ? &it->second : nullptr;
}

std::vector<std::string> DefinitionStore::getCategoryNames() const {
  std::vector<std::string> names;
  names.reserve(m_categories.size());
  for (const auto &[name, _] : m_categories) {
    names.push_back(name);
  }
  return names;
}

size_t DefinitionStore::getDefinitionCount() const {
  size_t count = 0;
  for (const auto &[_, store] : m_categories) {
    count += store.size();
  }
  return count;
}

} // namespace OvermapAtlas
