#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "infrastructure/ConfigLoader.hpp"

using namespace omnisplit::infrastructure;
using json = nlohmann::json;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    fs::path testRoot = "test_project_root_config";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);
    const fs::path configPath = testRoot / "config.json";

    const OmnisplitConfig defaults = OmnisplitConfig::Defaults();
    assert(!defaults.cacheDirectory.empty());
    assert(defaults.cacheMaxAgeHours == 24.0);
    assert(defaults.workerThreads == 2);

    // Missing file
    {
        OmnisplitConfig config = ConfigLoader::Load(configPath);
        assert(config.cacheDirectory == defaults.cacheDirectory);
        assert(config.extractionTimeoutSeconds == defaults.extractionTimeoutSeconds);
    }

    // Malformed JSON
    {
        std::ofstream(configPath) << "{ not json";
        OmnisplitConfig config = ConfigLoader::Load(configPath);
        assert(config.cacheMaxAgeHours == defaults.cacheMaxAgeHours);
    }

    // Bad keys fall back one by one.
    {
        std::ofstream(configPath) << R"({
            "cache_directory": "/tmp/omnisplit-test-cache",
            "cache_max_age_hours": "soon",
            "cleanup_interval_minutes": -5,
            "extraction_timeout_seconds": 30,
            "worker_threads": 0,
            "revalidate_against_source": false
        })";
        OmnisplitConfig config = ConfigLoader::Load(configPath);
        assert(config.cacheDirectory == fs::path("/tmp/omnisplit-test-cache"));
        assert(config.cacheMaxAgeHours == defaults.cacheMaxAgeHours);
        assert(config.cleanupIntervalMinutes == defaults.cleanupIntervalMinutes);
        assert(config.extractionTimeoutSeconds == 30.0);
        assert(config.workerThreads == defaults.workerThreads);
        assert(!config.revalidateAgainstSource);
    }

    // Save keeps keys it does not own.
    {
        std::ofstream(configPath) << R"({"library_root": "/srv/books", "worker_threads": 3})";
        OmnisplitConfig config = ConfigLoader::Load(configPath);
        assert(config.workerThreads == 3);

        config.cacheMaxAgeHours = 6.5;
        ConfigLoader::Save(configPath, config);

        json saved;
        std::ifstream(configPath) >> saved;
        assert(saved.at("library_root") == "/srv/books");
        assert(saved.at("cache_max_age_hours") == 6.5);

        OmnisplitConfig reloaded = ConfigLoader::Load(configPath);
        assert(reloaded.cacheMaxAgeHours == 6.5);
        assert(reloaded.workerThreads == 3);
        assert(reloaded.repositoryPath == config.repositoryPath);
    }

    size_t leftovers = 0;
    for (const auto& entry : fs::directory_iterator(testRoot)) {
        if (entry.path().extension() == ".tmp") ++leftovers;
    }
    assert(leftovers == 0 && "Atomic writes must not leave temp files.");

    fs::remove_all(testRoot);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
