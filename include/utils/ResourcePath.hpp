/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RESOURCEPATH_HPP
#define RESOURCEPATH_HPP

#include <string>
#include <vector>

namespace SoloAdventure {

/**
 * ResourcePath - Resolves content paths and the per-user data directory.
 *
 * Content (res/settings.json, res/profiles.json, res/campaigns/) is looked
 * up in the working directory first, then next to the executable and one
 * or two levels above it (build trees). Save files and the character
 * roster default to the SDL preference directory.
 *
 * Usage:
 *   ResourcePath::init();  // Call once at startup
 *   std::string path = ResourcePath::resolve("res/profiles.json");
 */
class ResourcePath {
public:
    /**
     * Initialize the search paths. Safe to call more than once.
     */
    static void init();

    /**
     * Resolve a relative resource path against the search paths.
     *
     * @param relativePath Path relative to the project root (e.g. "res/profiles.json")
     * @return First existing match, or the original path if none exists
     */
    static std::string resolve(const std::string& relativePath);

    static bool exists(const std::string& relativePath);

    /**
     * Add a search path. Higher priority paths are searched first.
     */
    static void addSearchPath(const std::string& path, int priority = 0);

    static void removeSearchPath(const std::string& path);

    // Highest priority search path, or empty if not initialized
    static std::string getBasePath();

    /**
     * Location for user data (saves, roster).
     *
     * @param name File or directory name inside the data directory
     * @return Path under SDL_GetPrefPath, or under the working directory
     *         when SDL cannot provide one
     */
    static std::string userDataPath(const std::string& name);

private:
    struct SearchPath {
        std::string path;
        int priority;
    };

    static std::vector<SearchPath> s_searchPaths;
    static bool s_initialized;

    static std::string getExecutablePath();
};

} // namespace SoloAdventure

#endif // RESOURCEPATH_HPP
