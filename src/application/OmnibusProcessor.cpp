/**
 * @file OmnibusProcessor.cpp
 * @brief Implementation of OmnibusProcessor.
 */

#include "application/OmnibusProcessor.hpp"
#include <algorithm>
#include <iostream>
#include "application/SubdocumentExtractionService.hpp"
#include "infrastructure/PathUtils.hpp"

namespace omnisplit::application {

using domain::OmnibusType;
using domain::VirtualBook;
using domain::Work;
using infrastructure::PathUtils;

namespace {
    std::string MetaValue(const Work& work, const std::string& key) {
        auto it = work.metadata.find(key);
        return it != work.metadata.end() ? it->second : std::string();
    }

    std::vector<std::string> AuthorsOf(const Work& work) {
        std::vector<std::string> authors;
        auto add = [&authors](const std::string& name) {
            if (!name.empty() && std::find(authors.begin(), authors.end(), name) == authors.end()) {
                authors.push_back(name);
            }
        };
        add(MetaValue(work, "author"));
        for (int i = 0; work.metadata.count("author" + std::to_string(i)); ++i) {
            add(MetaValue(work, "author" + std::to_string(i)));
        }
        return authors;
    }
}

OmnibusProcessor::OmnibusProcessor(std::shared_ptr<OmnibusDetector> detector,
                                   std::shared_ptr<OmnibusWorkExtractor> extractor,
                                   std::shared_ptr<domain::VirtualBookRepository> repository,
                                   std::shared_ptr<SubdocumentExtractionService> contentService)
    : m_detector(std::move(detector)),
      m_extractor(std::move(extractor)),
      m_repository(std::move(repository)),
      m_contentService(std::move(contentService)) {}

std::vector<VirtualBook> OmnibusProcessor::ToVirtualBooks(const domain::Omnibus& omnibus,
                                                          const std::string& containerUrl,
                                                          const std::vector<Work>& works) {
    std::vector<VirtualBook> books;
    books.reserve(works.size());
    for (size_t i = 0; i < works.size(); ++i) {
        const Work& work = works[i];

        VirtualBook book;
        book.id = omnibus.id + "-" + std::to_string(i + 1);
        book.omnibusId = omnibus.id;
        book.title = work.title;
        book.sortTitle = work.title;
        book.number = static_cast<float>(work.position);
        book.numberSort = static_cast<float>(work.position);
        book.fileLastModified = omnibus.fileLastModified;
        book.fileSize = omnibus.fileSize;
        book.url = containerUrl + "#" + PathUtils::PercentEncode(work.href, true);

        book.metadata.title = work.title;
        book.metadata.summary = "Part of omnibus: " + omnibus.name;
        std::string description = MetaValue(work, "description");
        if (!description.empty()) book.metadata.summary += "\n\n" + description;
        book.metadata.number = std::to_string(work.position);
        book.metadata.numberSort = static_cast<float>(work.position);
        book.metadata.authors = AuthorsOf(work);
        book.metadata.language = MetaValue(work, "language");
        book.metadata.publisher = MetaValue(work, "publisher");
        books.push_back(std::move(book));
    }
    return books;
}

ProcessingResult OmnibusProcessor::processOmnibus(const domain::Omnibus& omnibus) {
    ProcessingResult result;

    auto path = PathUtils::FileUrlToPath(omnibus.url);
    if (!path) {
        std::cerr << "[OmnibusProcessor] Unreadable location for " << omnibus.name << ": " << omnibus.url << std::endl;
        return result;
    }

    OmnibusType detected = m_detector->detect(path->string());
    std::vector<Work> works = m_extractor->extractWorks(path->string());

    bool tocEvidence = works.size() > 1 &&
        std::any_of(works.begin(), works.end(), [](const Work& w) { return w.type != domain::WorkType::Other; });

    if (detected == OmnibusType::None && tocEvidence) {
        detected = OmnibusType::GenericOmnibus;
    }

    if (m_contentService) {
        m_contentService->evictOmnibus(omnibus);
    }

    if (detected == OmnibusType::None || works.empty()) {
        if (m_repository->existsByOmnibusId(omnibus.id)) {
            std::cout << "[OmnibusProcessor] " << omnibus.name << " is no longer an omnibus, removing its virtual books" << std::endl;
            m_repository->deleteByOmnibusId(omnibus.id);
        }
        return result;
    }

    std::vector<VirtualBook> books = ToVirtualBooks(omnibus, PathUtils::PathToFileUrl(*path), works);

    m_repository->replaceByOmnibusId(omnibus, books);

    result.detected = detected;
    result.virtualBooksCreated = static_cast<int>(books.size());
    std::cout << "[OmnibusProcessor] Created " << books.size() << " virtual books for "
              << domain::OmnibusTypeToString(detected) << " omnibus: " << omnibus.name << std::endl;
    return result;
}

} // namespace omnisplit::application
