/**
 * @file AtomicFile.hpp
 * @brief Whole-file replacement through a temp file and rename.
 */

#pragma once
#include <filesystem>
#include <string>

namespace omnisplit::infrastructure {

/**
 * @class AtomicFile
 * @brief Readers of the target see either the old or the new content, never a mix.
 */
class AtomicFile {
public:
    /**
     * @brief Writes @p content to @p target via "<target>.<timestamp>.tmp" then rename.
     * Creates missing parent directories.
     * @throws std::runtime_error on any failure; the temp file is removed.
     */
    static void Write(const std::filesystem::path& target, const std::string& content);

    /** @brief Unique sibling temp path used by Write. */
    static std::filesystem::path TempPathFor(const std::filesystem::path& target);
};

} // namespace omnisplit::infrastructure
