/**
 * @file OmnibusProcessor.hpp
 * @brief Scan pipeline turning an omnibus container into virtual book records.
 */

#pragma once
#include <memory>
#include <vector>
#include "application/OmnibusDetector.hpp"
#include "application/OmnibusWorkExtractor.hpp"
#include "domain/OmnibusType.hpp"
#include "domain/VirtualBookRepository.hpp"

namespace omnisplit::application {

class SubdocumentExtractionService;

struct ProcessingResult {
    domain::OmnibusType detected = domain::OmnibusType::None;
    int virtualBooksCreated = 0;
};

/**
 * @class OmnibusProcessor
 * @brief Detects, partitions and (re)registers the works of one omnibus.
 *
 * Re-processing replaces the omnibus's virtual books instead of adding to them,
 * and evicts their cached extractions when a content service is attached.
 */
class OmnibusProcessor {
public:
    OmnibusProcessor(std::shared_ptr<OmnibusDetector> detector,
                     std::shared_ptr<OmnibusWorkExtractor> extractor,
                     std::shared_ptr<domain::VirtualBookRepository> repository,
                     std::shared_ptr<SubdocumentExtractionService> contentService = nullptr);

    /**
     * @brief Scans @p omnibus and replaces its virtual books.
     * An unreadable location yields {None, 0} and changes nothing.
     * @throws std::runtime_error if the repository cannot be written.
     */
    ProcessingResult processOmnibus(const domain::Omnibus& omnibus);

    /**
     * @brief Maps works to virtual books. Ids are "<omnibusId>-<ordinal>",
     * the ordinal being the 1-based index in @p works.
     */
    static std::vector<domain::VirtualBook> ToVirtualBooks(const domain::Omnibus& omnibus,
                                                           const std::string& containerUrl,
                                                           const std::vector<domain::Work>& works);

private:
    std::shared_ptr<OmnibusDetector> m_detector;
    std::shared_ptr<OmnibusWorkExtractor> m_extractor;
    std::shared_ptr<domain::VirtualBookRepository> m_repository;
    std::shared_ptr<SubdocumentExtractionService> m_contentService;
};

} // namespace omnisplit::application
