/**
 * @file ArchiveSlicer.hpp
 * @brief Interface for writing one work of a container as a standalone archive.
 */

#pragma once
#include <filesystem>
#include "domain/CancellationToken.hpp"
#include "domain/Work.hpp"

namespace omnisplit::domain {

/**
 * @class ArchiveSlicer
 * @brief Physically materializes a Work as a new archive.
 */
class ArchiveSlicer {
public:
    virtual ~ArchiveSlicer() = default;

    /**
     * @brief Writes the content belonging to @p work into @p destPath.
     * @param work Descriptor of the work (href marks where it starts).
     * @param sourceContainer The omnibus archive, read only.
     * @param destPath File to create. Overwritten if present.
     * @param cancel Polled between entries.
     * @throws std::exception on any failure; the caller removes partial output.
     */
    virtual void extract(const Work& work,
                         const std::filesystem::path& sourceContainer,
                         const std::filesystem::path& destPath,
                         const CancellationToken& cancel) = 0;
};

} // namespace omnisplit::domain
