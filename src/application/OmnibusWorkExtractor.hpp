/**
 * @file OmnibusWorkExtractor.hpp
 * @brief Partitions an omnibus container into its ordered list of works.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "application/WorkExtractionStrategies.hpp"
#include "domain/EpubContainer.hpp"
#include "domain/Work.hpp"

namespace omnisplit::application {

/**
 * @class OmnibusWorkExtractor
 * @brief Orchestrates open -> read TOC -> classify -> strategy -> spine fallback.
 *
 * "No works" means "not an omnibus", so nothing here throws to the caller.
 */
class OmnibusWorkExtractor {
public:
    explicit OmnibusWorkExtractor(std::shared_ptr<domain::ContainerReader> reader);

    /**
     * @brief Extracts the works of the container at @p containerPath.
     * @return Works in document order; empty if the container is unreadable.
     * A container with a non-empty spine never yields an empty list.
     */
    std::vector<domain::Work> extractWorks(const std::string& containerPath) const;

    /**
     * @brief Reads container-level metadata field by field.
     * A failing field is logged and omitted; the others are still read.
     */
    static ContainerMetadata ReadMetadata(const domain::EpubContainer& container);

private:
    std::shared_ptr<domain::ContainerReader> m_reader;
};

} // namespace omnisplit::application
