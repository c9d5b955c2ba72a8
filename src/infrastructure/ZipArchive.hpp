/**
 * @file ZipArchive.hpp
 * @brief RAII wrappers over libzip for reading and writing archives.
 */

#pragma once
#include <ctime>
#include <deque>
#include <filesystem>
#include <string>
#include <vector>

struct zip;

namespace omnisplit::infrastructure {

/**
 * @class ZipReader
 * @brief Read-only archive handle. Not thread-safe; open one per thread.
 */
class ZipReader {
public:
    /** @throws std::runtime_error if the file is missing or not a zip archive. */
    explicit ZipReader(const std::filesystem::path& path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    bool contains(const std::string& name) const;

    /** @throws std::runtime_error if the entry is missing or cannot be fully read. */
    std::string read(const std::string& name) const;

    std::vector<std::string> entryNames() const;

private:
    struct zip* m_archive = nullptr;
};

/**
 * @class ZipWriter
 * @brief Builds a new archive. Nothing reaches disk until close().
 *
 * Destroying an unclosed writer discards the archive.
 */
class ZipWriter {
public:
    /** @brief Fixed entry time used for reproducible output (2000-01-01T00:00:00Z). */
    static constexpr std::time_t kFixedMtime = 946684800;

    /** @throws std::runtime_error if the destination cannot be created. */
    explicit ZipWriter(const std::filesystem::path& path);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * @brief Adds an entry. Entries are written in call order.
     * @param stored true for no compression (required for an EPUB mimetype).
     */
    void add(const std::string& name, std::string data, bool stored = false);

    /** @throws std::runtime_error if libzip fails to write the archive. */
    void close();

private:
    struct zip* m_archive = nullptr;
    std::deque<std::string> m_buffers; // must outlive zip_close
};

} // namespace omnisplit::infrastructure
