/**
 * @file ContentResource.hpp
 * @brief Handle to a materialized sub-document in the cache.
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

namespace omnisplit::domain {

/**
 * @class ContentResource
 * @brief Byte resource returned by the content service.
 *
 * The file behind it is final-named and never rewritten in place, so readers
 * see either the whole archive or nothing. It may be evicted later by cleanup.
 */
class ContentResource {
public:
    ContentResource() = default;

    /**
     * @brief Binds to an existing file.
     * @throws ResourceAccessError if the file cannot be stat'ed.
     */
    explicit ContentResource(std::filesystem::path path);

    const std::filesystem::path& path() const { return m_path; }
    std::uintmax_t size() const { return m_size; }

    /** @throws ResourceAccessError if the file cannot be opened. */
    std::unique_ptr<std::ifstream> open() const;

    /** @throws ResourceAccessError on open or short read. */
    std::vector<std::uint8_t> readAll() const;

private:
    std::filesystem::path m_path;
    std::uintmax_t m_size = 0;
};

} // namespace omnisplit::domain
