/**
 * @file WorkExtractionStrategies.cpp
 * @brief Per-layout TOC walkers that turn entries into works.
 */

#include "application/WorkExtractionStrategies.hpp"
#include <iostream>
#include "domain/TitleNormalizer.hpp"
#include "domain/WorkTypeClassifier.hpp"

namespace omnisplit::application {

using domain::TocEntry;
using domain::TocType;
using domain::Work;
using domain::WorkType;
using domain::WorkTypeClassifier;

namespace {
    std::string Placeholder(size_t index) {
        return "Work " + std::to_string(index + 1);
    }

    std::string TitleOrPlaceholder(const TocEntry& entry, size_t index) {
        std::string title = domain::TitleNormalizer::Normalize(entry.title.value_or(""));
        return title.empty() ? Placeholder(index) : title;
    }

    // Title keywords first; a bare title inside "The Complete Poems" is still a poem.
    WorkType TypeFor(const std::string& title, WorkType collectionHint) {
        WorkType type = WorkTypeClassifier::Classify(title);
        if (type == WorkType::GenericEntry && collectionHint != WorkType::GenericEntry) {
            return collectionHint;
        }
        return type;
    }

    WorkType CollectionHint(const ContainerMetadata& metadata) {
        return WorkTypeClassifier::ClassifyCollection(metadata.title(), metadata.subjects);
    }
}

WorkExtractionStrategies::Strategy WorkExtractionStrategies::For(TocType type) {
    switch (type) {
        case TocType::Shakespeare: return &ExtractShakespeare;
        case TocType::DelphiClassics: return &ExtractDelphiClassics;
        case TocType::Generic: return &ExtractGeneric;
        case TocType::Unknown: return &ExtractNothing;
    }
    return &ExtractNothing;
}

std::vector<Work> WorkExtractionStrategies::Extract(TocType type,
                                                    const std::vector<TocEntry>& toc,
                                                    const ContainerMetadata& metadata) {
    return For(type)(toc, metadata);
}

std::vector<Work> WorkExtractionStrategies::ExtractShakespeare(const std::vector<TocEntry>& toc,
                                                               const ContainerMetadata& metadata) {
    std::cout << "[WorkExtractionStrategies] Processing Shakespeare works format" << std::endl;
    const WorkType hint = CollectionHint(metadata);

    std::vector<Work> works;
    for (size_t i = 0; i < toc.size(); ++i) {
        const TocEntry& entry = toc[i];
        if (!entry.title) continue;

        Work work;
        work.title = TitleOrPlaceholder(entry, i);
        work.href = entry.href.value_or("");
        work.position = static_cast<int>(i + 1);
        work.type = TypeFor(work.title, hint);
        work.metadata = metadata.fields;
        work.metadata["author"] = "William Shakespeare";
        works.push_back(std::move(work));
    }
    return works;
}

std::vector<Work> WorkExtractionStrategies::ExtractDelphiClassics(const std::vector<TocEntry>& toc,
                                                                  const ContainerMetadata& metadata) {
    std::cout << "[WorkExtractionStrategies] Processing Delphi Classics format" << std::endl;

    std::vector<Work> works;
    for (const auto& section : toc) {
        const std::string sectionTitle = section.title.value_or("");
        for (size_t i = 0; i < section.children.size(); ++i) {
            const TocEntry& child = section.children[i];

            Work work;
            work.title = TitleOrPlaceholder(child, i);
            work.href = child.href.value_or("");
            work.position = static_cast<int>(i + 1);
            work.type = WorkType::DelphiChapter;
            work.metadata = metadata.fields;
            work.metadata["section"] = sectionTitle;
            works.push_back(std::move(work));
        }
    }
    return works;
}

std::vector<Work> WorkExtractionStrategies::ExtractGeneric(const std::vector<TocEntry>& toc,
                                                           const ContainerMetadata& metadata) {
    std::cout << "[WorkExtractionStrategies] Processing generic TOC format" << std::endl;
    const WorkType hint = CollectionHint(metadata);

    std::vector<Work> works;
    works.reserve(toc.size());
    for (size_t i = 0; i < toc.size(); ++i) {
        Work work;
        work.title = TitleOrPlaceholder(toc[i], i);
        work.href = toc[i].href.value_or("");
        work.position = static_cast<int>(i + 1);
        work.type = TypeFor(work.title, hint);
        work.metadata = metadata.fields;
        works.push_back(std::move(work));
    }
    return works;
}

std::vector<Work> WorkExtractionStrategies::ExtractNothing(const std::vector<TocEntry>&,
                                                           const ContainerMetadata&) {
    return {};
}

std::vector<Work> WorkExtractionStrategies::ExtractFromSpine(const std::vector<std::string>& spine,
                                                             const ContainerMetadata& metadata) {
    std::cout << "[WorkExtractionStrategies] Falling back to spine-based extraction" << std::endl;

    std::vector<Work> works;
    works.reserve(spine.size());
    for (size_t i = 0; i < spine.size(); ++i) {
        Work work;
        work.title = Placeholder(i);
        work.href = spine[i];
        work.position = static_cast<int>(i + 1);
        work.type = WorkType::Other;
        work.metadata = metadata.fields;
        works.push_back(std::move(work));
    }
    return works;
}

} // namespace omnisplit::application
