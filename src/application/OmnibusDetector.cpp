/**
 * @file OmnibusDetector.cpp
 * @brief Publisher and title heuristics for omnibus detection.
 */

#include "application/OmnibusDetector.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include "domain/ContentErrors.hpp"

namespace omnisplit::application {

using domain::OmnibusType;

namespace {
    std::string ToLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
        return s;
    }

    bool StartsWith(const std::string& s, const std::string& prefix) {
        return s.compare(0, prefix.size(), prefix) == 0;
    }

    // "delphi" followed somewhere later by @p word.
    bool DelphiThen(const std::string& lower, const char* word) {
        size_t delphi = lower.find("delphi");
        return delphi != std::string::npos && lower.find(word, delphi + 6) != std::string::npos;
    }

    constexpr std::array<const char*, 5> kTitleMarkers = {
        "omnibus", "collection", "anthology", "complete works", "collected works"
    };
}

OmnibusDetector::OmnibusDetector(std::shared_ptr<domain::ContainerReader> reader)
    : m_reader(std::move(reader)) {}

OmnibusType OmnibusDetector::Classify(const std::string& title,
                                      const std::vector<std::string>& publishers,
                                      size_t authorCount) {
    for (const auto& publisher : publishers) {
        std::string lower = ToLower(publisher);
        if (DelphiThen(lower, "classics") || DelphiThen(lower, "publishing")) {
            return OmnibusType::DelphiClassics;
        }
    }

    std::string lowerTitle = ToLower(title);
    if (StartsWith(lowerTitle, "collected") || StartsWith(lowerTitle, "complete")) {
        return OmnibusType::GenericOmnibus;
    }
    for (const char* marker : kTitleMarkers) {
        if (lowerTitle.find(marker) != std::string::npos) return OmnibusType::GenericOmnibus;
    }

    if (authorCount > 1) return OmnibusType::GenericOmnibus;
    return OmnibusType::None;
}

OmnibusType OmnibusDetector::detect(const std::string& containerPath) const {
    try {
        auto container = m_reader->open(containerPath);
        if (!container) {
            throw domain::ContainerUnreadableError("Reader returned no container for " + containerPath);
        }
        OmnibusType type = Classify(container->title().value_or(""),
                                    container->publishers(),
                                    container->authors().size());
        if (type != OmnibusType::None) {
            std::cout << "[OmnibusDetector] " << containerPath << " detected as "
                      << domain::OmnibusTypeToString(type) << std::endl;
        }
        return type;
    } catch (const std::exception& e) {
        std::cerr << "[OmnibusDetector] Error detecting omnibus for " << containerPath << ": " << e.what() << std::endl;
    }
    return OmnibusType::None;
}

} // namespace omnisplit::application
