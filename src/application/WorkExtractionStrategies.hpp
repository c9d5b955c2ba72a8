/**
 * @file WorkExtractionStrategies.hpp
 * @brief One work-partitioning algorithm per TOC structure, plus the spine fallback.
 */

#pragma once
#include <map>
#include <string>
#include <vector>
#include "domain/TocEntry.hpp"
#include "domain/TocType.hpp"
#include "domain/Work.hpp"

namespace omnisplit::application {

/**
 * @struct ContainerMetadata
 * @brief Container-level metadata read once per extraction run.
 *
 * fields holds the keys merged into every Work: title, author0..authorN,
 * description, language, publisher. Absent fields are simply missing.
 */
struct ContainerMetadata {
    std::map<std::string, std::string> fields;
    std::vector<std::string> subjects;

    std::string title() const {
        auto it = fields.find("title");
        return it != fields.end() ? it->second : std::string();
    }
};

/**
 * @class WorkExtractionStrategies
 * @brief Pure functions turning a classified TOC into an ordered list of works.
 *
 * None of them throw. An empty result tells the caller to use ExtractFromSpine.
 */
class WorkExtractionStrategies {
public:
    using Strategy = std::vector<domain::Work> (*)(const std::vector<domain::TocEntry>&, const ContainerMetadata&);

    /**
     * @brief Handler for @p type. Unknown maps to a strategy that yields nothing.
     */
    static Strategy For(domain::TocType type);

    /** @brief Shorthand for For(type)(toc, metadata). */
    static std::vector<domain::Work> Extract(domain::TocType type,
                                             const std::vector<domain::TocEntry>& toc,
                                             const ContainerMetadata& metadata);

    /**
     * @brief One work per titled top-level entry, author forced to William Shakespeare.
     * Untitled entries are skipped but still consume a position.
     */
    static std::vector<domain::Work> ExtractShakespeare(const std::vector<domain::TocEntry>& toc,
                                                        const ContainerMetadata& metadata);

    /**
     * @brief Flattens every section's children. Positions restart at 1 in each section
     * and metadata["section"] carries the parent title.
     */
    static std::vector<domain::Work> ExtractDelphiClassics(const std::vector<domain::TocEntry>& toc,
                                                           const ContainerMetadata& metadata);

    /** @brief One work per top-level entry; missing titles become "Work <n>". */
    static std::vector<domain::Work> ExtractGeneric(const std::vector<domain::TocEntry>& toc,
                                                    const ContainerMetadata& metadata);

    static std::vector<domain::Work> ExtractNothing(const std::vector<domain::TocEntry>& toc,
                                                    const ContainerMetadata& metadata);

    /** @brief One work of type Other per spine document, titled "Work <n>". */
    static std::vector<domain::Work> ExtractFromSpine(const std::vector<std::string>& spine,
                                                      const ContainerMetadata& metadata);
};

} // namespace omnisplit::application
