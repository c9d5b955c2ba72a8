/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving Omnisplit settings (settings.json).
 *
 * Keeps JSON parsing of the settings file in one place; services receive a
 * plain OmnisplitConfig value.
 */

#pragma once

#include <filesystem>
#include <string>

namespace omnisplit::infrastructure {

/**
 * @struct OmnisplitConfig
 * @brief Effective settings. Defaults apply to every key the file omits.
 */
struct OmnisplitConfig {
    std::filesystem::path cacheDirectory;   ///< cache_directory
    double cacheMaxAgeHours = 24.0;         ///< cache_max_age_hours
    double cleanupIntervalMinutes = 60.0;   ///< cleanup_interval_minutes, 0 disables
    double extractionTimeoutSeconds = 120.0;///< extraction_timeout_seconds, 0 = unbounded
    int workerThreads = 2;                  ///< worker_threads, at least 1
    std::filesystem::path repositoryPath;   ///< repository_path
    bool revalidateAgainstSource = true;    ///< revalidate_against_source

    /** @brief Defaults with platform paths filled in. */
    static OmnisplitConfig Defaults();
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from @p configPath.
     * A missing file yields defaults. A malformed file, or a key of the wrong
     * type or out of range, is logged and that key keeps its default.
     */
    static OmnisplitConfig Load(const std::filesystem::path& configPath);

    /** @brief Load() from PathUtils::GetDefaultConfigPath(). */
    static OmnisplitConfig LoadDefault();

    /**
     * @brief Writes @p config to @p configPath, preserving keys it does not know.
     * @throws std::runtime_error if the file cannot be written.
     */
    static void Save(const std::filesystem::path& configPath, const OmnisplitConfig& config);
};

} // namespace omnisplit::infrastructure
