/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/ResourcePath.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <filesystem>

#ifndef SOLO_APP_NAME
#define SOLO_APP_NAME "SoloAdventure"
#endif

namespace SoloAdventure {

namespace fs = std::filesystem;

// Static member definitions
std::vector<ResourcePath::SearchPath> ResourcePath::s_searchPaths;
bool ResourcePath::s_initialized = false;

void ResourcePath::init() {
    if (s_initialized) {
        return;
    }

    // Working directory wins so a checkout can be run in place
    addSearchPath(fs::current_path().string(), 10);

    // Executable directory, then build/ and build/<config>/ parents
    fs::path exeDir(getExecutablePath());
    addSearchPath(exeDir.string(), 5);
    fs::path parent = exeDir.parent_path();
    for (int depth = 0; depth < 2 && !parent.empty(); ++depth) {
        addSearchPath(parent.string(), 4 - depth);
        parent = parent.parent_path();
    }

    s_initialized = true;
    SOLO_INFO("ResourcePath", "Base path = " + getBasePath());
}

std::string ResourcePath::getExecutablePath() {
    // SDL3 returns const char* (static storage, no need to free)
    const char* basePath = SDL_GetBasePath();
    if (basePath && basePath[0] != '\0') {
        return std::string(basePath);
    }
    return fs::current_path().string();
}

std::string ResourcePath::resolve(const std::string& relativePath) {
    if (!s_initialized || fs::path(relativePath).is_absolute()) {
        return relativePath;
    }

    for (const auto& searchPath : s_searchPaths) {
        fs::path fullPath = fs::path(searchPath.path) / relativePath;
        std::error_code ec;
        if (fs::exists(fullPath, ec)) {
            return fullPath.string();
        }
    }

    // Let the caller's error handling report the missing resource
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
        it->priority = std::max(it->priority, priority);
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

std::string ResourcePath::userDataPath(const std::string& name) {
    char* prefPath = SDL_GetPrefPath("HammerForged", SOLO_APP_NAME);
    if (!prefPath) {
        SOLO_WARN("ResourcePath", std::string("SDL_GetPrefPath failed: ") + SDL_GetError());
        return (fs::current_path() / name).string();
    }
    fs::path dataDir(prefPath);
    SDL_free(prefPath);
    return (dataDir / name).string();
}

} // namespace SoloAdventure
