#include "infrastructure/AtomicFile.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace omnisplit::infrastructure {

namespace fs = std::filesystem;

fs::path AtomicFile::TempPathFor(const fs::path& target) {
    static std::atomic<unsigned long> sequence{0};
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = target;
    tempPath += "." + std::to_string(timestamp) + "-" + std::to_string(sequence++) + ".tmp";
    return tempPath;
}

void AtomicFile::Write(const fs::path& target, const std::string& content) {
    // 1. Ensure directory exists
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory " + target.parent_path().string() + ": " + ec.message());
        }
    }

    // 2. Write to temp
    fs::path tempPath = TempPathFor(target);
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to open temp file: " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            throw std::runtime_error("Write failed: " + tempPath.string());
        }
    }

    // 3. Atomic rename
    std::error_code ec;
    fs::rename(tempPath, target, ec);
    if (ec) {
        std::cerr << "[AtomicFile] Rename failed: " << ec.message() << std::endl;
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw std::runtime_error("Rename to " + target.string() + " failed: " + ec.message());
    }
}

} // namespace omnisplit::infrastructure
