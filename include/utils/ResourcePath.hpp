/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RESOURCEPATH_HPP
#define RESOURCEPATH_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace OvermapAtlas {

/**
 * ResourcePath - Resolves tool resources and game content locations.
 *
 * Handles path resolution for:
 * - Tool resources (settings file) relative to the executable or project root
 * - The game's JSON content root derived from a game installation path
 *
 * Usage:
 *   ResourcePath::init();  // Call once at startup
 *   std::string settings = ResourcePath::resolve("res/atlas_settings.json");
 *   auto jsonRoot = ResourcePath::gameDataDir("~/games/cdda");
 */
class ResourcePath {
public:
    /**
     * Initialize the resource path system.
     * Registers the executable directory (or the project root when running
     * from bin/debug or bin/release) as the base search path.
     */
    static void init();

    /**
     * Resolve a relative resource path against the registered search paths.
     *
     * @param relativePath Path relative to resource root (e.g., "res/atlas_settings.json")
     * @return Absolute path to the resource, or the original path if not found
     */
    static std::string resolve(const std::string& relativePath);

    /**
     * Check if a resource exists at the given relative path.
     */
    static bool exists(const std::string& relativePath);

    /**
     * Add a search path. Higher priority paths are searched first.
     */
    static void addSearchPath(const std::string& path, int priority = 0);

    static void removeSearchPath(const std::string& path);

    /**
     * @return The highest priority search path, or empty if not initialized
     */
    static std::string getBasePath();

    /**
     * Expand a leading '~' using the HOME (or USERPROFILE) environment variable.
     */
    static std::filesystem::path expandUser(const std::string& path);

    /**
     * Locate the JSON content root of a game installation.
     *
     * A path whose last component is already "json" is used as is; any other
     * path is treated as the game's base directory and "data/json" is
     * appended.
     */
    static std::filesystem::path gameDataDir(const std::string& gamePath);

private:
    struct SearchPath {
        std::string path;
        int priority;
    };

    static std::vector<SearchPath> s_searchPaths;
    static bool s_initialized;

    static void detectExecutionContext();
    static std::string getExecutablePath();
};

} // namespace OvermapAtlas

#endif // RESOURCEPATH_HPP
