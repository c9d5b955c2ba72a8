/**
 * @file OmnibusDetector.hpp
 * @brief Metadata heuristics deciding whether a container is an omnibus edition.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "domain/EpubContainer.hpp"
#include "domain/OmnibusType.hpp"

namespace omnisplit::application {

/**
 * @class OmnibusDetector
 * @brief Looks at publisher, title and author count only; never at the TOC.
 */
class OmnibusDetector {
public:
    explicit OmnibusDetector(std::shared_ptr<domain::ContainerReader> reader);

    /**
     * @brief Detects the omnibus flavour of the container at @p containerPath.
     * @return None when nothing matches or the container cannot be read (logged).
     */
    domain::OmnibusType detect(const std::string& containerPath) const;

    /** @brief The rules themselves, over already-read metadata. */
    static domain::OmnibusType Classify(const std::string& title,
                                        const std::vector<std::string>& publishers,
                                        size_t authorCount);

private:
    std::shared_ptr<domain::ContainerReader> m_reader;
};

} // namespace omnisplit::application
