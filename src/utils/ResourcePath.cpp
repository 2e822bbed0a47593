/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/ResourcePath.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cstdlib>
#include <format>

namespace OvermapAtlas {

namespace fs = std::filesystem;

std::vector<ResourcePath::SearchPath> ResourcePath::s_searchPaths;
bool ResourcePath::s_initialized = false;

void ResourcePath::init() {
    if (s_initialized) {
        return;
    }

    detectExecutionContext();
    s_initialized = true;

    RESOURCEPATH_INFO(std::format("Base path = {}", getBasePath()));
}

void ResourcePath::detectExecutionContext() {
    fs::path binPath(getExecutablePath());

    // Development builds run from bin/debug or bin/release under the project root
    std::string binPathStr = binPath.generic_string();
    if (binPathStr.find("/bin/debug/") != std::string::npos ||
        binPathStr.find("/bin/release/") != std::string::npos) {
        fs::path projectRoot = binPath.parent_path().parent_path().parent_path();
        addSearchPath(projectRoot.string(), 0);
    } else {
        addSearchPath(binPath.string(), 0);
    }

    // The working directory wins over the install location
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (!ec) {
        addSearchPath(cwd.string(), 1);
    }
}

std::string ResourcePath::getExecutablePath() {
    // SDL3 returns const char* (static storage, no need to free)
    const char* basePath = SDL_GetBasePath();
    if (basePath && basePath[0] != '\0') {
        return std::string(basePath);
    }

    RESOURCEPATH_WARN(std::format("SDL_GetBasePath failed: {}", SDL_GetError()));
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    return ec ? std::string(".") : cwd.string();
}

std::string ResourcePath::resolve(const std::string& relativePath) {
    if (!s_initialized || fs::path(relativePath).is_absolute()) {
        return relativePath;
    }

    std::error_code ec;
    for (const auto& searchPath : s_searchPaths) {
        fs::path fullPath = fs::path(searchPath.path) / relativePath;
        if (fs::exists(fullPath, ec)) {
            return fullPath.string();
        }
    }

    // Not found - the caller reports the missing resource
    return relativePath;
}

bool ResourcePath::exists(const std::string& relativePath) {
    std::error_code ec;
    return fs::exists(resolve(relativePath), ec);
}

void ResourcePath::addSearchPath(const std::string& path, int priority) {
    auto it = std::find_if(s_searchPaths.begin(), s_searchPaths.end(),
        [&path](const SearchPath& sp) { return sp.path == path; });

    if (it != s_searchPaths.end()) {
        it->priority = priority;
    } else {
        s_searchPaths.push_back({path, priority});
    }

    std::stable_sort(s_searchPaths.begin(), s_searchPaths.end(),
        [](const SearchPath& a, const SearchPath& b) {
            return a.priority > b.priority;
        });
}

void ResourcePath::removeSearchPath(const std::string& path) {
    s_searchPaths.erase(
        std::remove_if(s_searchPaths.begin(), s_searchPaths.end(),
            [&path](const SearchPath& sp) { return sp.path == path; }),
        s_searchPaths.end());
}

std::string ResourcePath::getBasePath() {
    if (s_searchPaths.empty()) {
        return "";
    }
    return s_searchPaths.front().path;
}

fs::path ResourcePath::expandUser(const std::string& path) {
    if (path.empty() || path.front() != '~') {
        return fs::path(path);
    }
    if (path.size() > 1 && path[1] != '/' && path[1] != '\\') {
        // ~otheruser is not supported
        return fs::path(path);
    }

    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        home = std::getenv("USERPROFILE");
    }
    if (home == nullptr || home[0] == '\0') {
        RESOURCEPATH_WARN("Cannot expand '~': HOME is not set");
        return fs::path(path);
    }

    std::string rest = path.size() > 2 ? path.substr(2) : std::string();
    return rest.empty() ? fs::path(home) : fs::path(home) / rest;
}

fs::path ResourcePath::gameDataDir(const std::string& gamePath) {
    fs::path base = expandUser(gamePath);

    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(base, ec);
    if (ec) {
        canonical = base;
    }

    // weakly_canonical keeps a trailing separator as an empty filename
    fs::path leaf = canonical.filename().empty() ? canonical.parent_path().filename()
                                                 : canonical.filename();
    if (leaf == "json") {
        return base;
    }
    return base / "data" / "json";
}

} // namespace OvermapAtlas
