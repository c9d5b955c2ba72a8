/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "infrastructure/AtomicFile.hpp"
#include "infrastructure/PathUtils.hpp"

namespace omnisplit::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
    void WarnType(const char* key, const char* expected) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected " << expected << std::endl;
    }

    void ReadNonNegative(const json& j, const char* key, double& target) {
        if (!j.contains(key)) return;
        const json& value = j.at(key);
        if (!value.is_number() || value.get<double>() < 0.0) {
            WarnType(key, "a non-negative number");
            return;
        }
        target = value.get<double>();
    }

    void ReadPath(const json& j, const char* key, fs::path& target) {
        if (!j.contains(key)) return;
        const json& value = j.at(key);
        if (!value.is_string() || value.get<std::string>().empty()) {
            WarnType(key, "a non-empty string");
            return;
        }
        target = value.get<std::string>();
    }
}

OmnisplitConfig OmnisplitConfig::Defaults() {
    OmnisplitConfig config;
    config.cacheDirectory = PathUtils::GetDefaultCacheDir();
    config.repositoryPath = PathUtils::GetDefaultRepositoryPath();
    return config;
}

OmnisplitConfig ConfigLoader::Load(const fs::path& configPath) {
    OmnisplitConfig config = OmnisplitConfig::Defaults();
    if (!fs::exists(configPath)) {
        return config;
    }

    json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        return config;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] " << configPath << " is not a JSON object, using defaults" << std::endl;
        return config;
    }

    ReadPath(j, "cache_directory", config.cacheDirectory);
    ReadNonNegative(j, "cache_max_age_hours", config.cacheMaxAgeHours);
    ReadNonNegative(j, "cleanup_interval_minutes", config.cleanupIntervalMinutes);
    ReadNonNegative(j, "extraction_timeout_seconds", config.extractionTimeoutSeconds);
    ReadPath(j, "repository_path", config.repositoryPath);

    if (j.contains("worker_threads")) {
        const json& value = j.at("worker_threads");
        if (value.is_number_integer() && value.get<long long>() >= 1 && value.get<long long>() <= 256) {
            config.workerThreads = value.get<int>();
        } else {
            WarnType("worker_threads", "an integer between 1 and 256");
        }
    }

    if (j.contains("revalidate_against_source")) {
        const json& value = j.at("revalidate_against_source");
        if (value.is_boolean()) {
            config.revalidateAgainstSource = value.get<bool>();
        } else {
            WarnType("revalidate_against_source", "a boolean");
        }
    }

    return config;
}

OmnisplitConfig ConfigLoader::LoadDefault() {
    return Load(PathUtils::GetDefaultConfigPath());
}

void ConfigLoader::Save(const fs::path& configPath, const OmnisplitConfig& config) {
    json j = json::object();

    // Try to load existing to preserve other settings
    if (fs::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            json existing;
            f >> existing;
            if (existing.is_object()) j = existing;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable " << configPath << ": " << e.what() << std::endl;
        }
    }

    j["cache_directory"] = config.cacheDirectory.string();
    j["cache_max_age_hours"] = config.cacheMaxAgeHours;
    j["cleanup_interval_minutes"] = config.cleanupIntervalMinutes;
    j["extraction_timeout_seconds"] = config.extractionTimeoutSeconds;
    j["worker_threads"] = config.workerThreads;
    j["repository_path"] = config.repositoryPath.string();
    j["revalidate_against_source"] = config.revalidateAgainstSource;

    AtomicFile::Write(configPath, j.dump(4));
}

} // namespace omnisplit::infrastructure
