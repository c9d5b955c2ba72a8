/**
 * @file OmnibusWorkExtractor.cpp
 * @brief Implementation of OmnibusWorkExtractor.
 */

#include "application/OmnibusWorkExtractor.hpp"
#include <iostream>
#include "domain/ContentErrors.hpp"
#include "domain/TocStructureClassifier.hpp"

namespace omnisplit::application {

using domain::EpubContainer;
using domain::TocEntry;
using domain::Work;

namespace {
    template<typename F>
    void ReadField(const char* name, F&& read) {
        try {
            read();
        } catch (const std::exception& e) {
            std::cerr << "[OmnibusWorkExtractor] Skipping metadata field '" << name << "': " << e.what() << std::endl;
        }
    }

    std::string Join(const std::vector<std::string>& values, const std::string& separator) {
        std::string out;
        for (const auto& v : values) {
            if (v.empty()) continue;
            if (!out.empty()) out += separator;
            out += v;
        }
        return out;
    }
}

OmnibusWorkExtractor::OmnibusWorkExtractor(std::shared_ptr<domain::ContainerReader> reader)
    : m_reader(std::move(reader)) {}

ContainerMetadata OmnibusWorkExtractor::ReadMetadata(const EpubContainer& container) {
    ContainerMetadata metadata;
    auto& fields = metadata.fields;

    ReadField("title", [&] {
        if (auto title = container.title(); title && !title->empty()) fields["title"] = *title;
    });
    ReadField("authors", [&] {
        auto authors = container.authors();
        for (size_t i = 0; i < authors.size(); ++i) {
            if (!authors[i].empty()) fields["author" + std::to_string(i)] = authors[i];
        }
    });
    ReadField("description", [&] {
        if (auto d = container.description(); d && !d->empty()) fields["description"] = *d;
    });
    ReadField("language", [&] {
        if (auto lang = container.language(); lang && !lang->empty()) fields["language"] = *lang;
    });
    ReadField("publisher", [&] {
        std::string publishers = Join(container.publishers(), ", ");
        if (!publishers.empty()) fields["publisher"] = publishers;
    });
    ReadField("subjects", [&] {
        metadata.subjects = container.subjects();
    });

    return metadata;
}

std::vector<Work> OmnibusWorkExtractor::extractWorks(const std::string& containerPath) const {
    std::unique_ptr<EpubContainer> container;
    std::vector<TocEntry> toc;
    std::vector<std::string> spine;

    try {
        container = m_reader->open(containerPath);
        if (!container) {
            throw domain::ContainerUnreadableError("Reader returned no container");
        }
        toc = container->toc();
        spine = container->spine();
    } catch (const domain::ContainerUnreadableError& e) {
        std::cerr << "[OmnibusWorkExtractor] Unreadable container " << containerPath << ": " << e.what() << std::endl;
        return {};
    } catch (const std::exception& e) {
        std::cerr << "[OmnibusWorkExtractor] Failed to read structure of " << containerPath << ": " << e.what() << std::endl;
        return {};
    }

    ContainerMetadata metadata = ReadMetadata(*container);

    domain::TocType type = domain::TocStructureClassifier::Classify(toc);
    std::cout << "[OmnibusWorkExtractor] " << containerPath << ": TOC classified as "
              << domain::TocTypeToString(type) << " (" << toc.size() << " top-level entries)" << std::endl;

    std::vector<Work> works = WorkExtractionStrategies::Extract(type, toc, metadata);
    if (works.empty()) {
        works = WorkExtractionStrategies::ExtractFromSpine(spine, metadata);
    }
    return works;
}

} // namespace omnisplit::application
