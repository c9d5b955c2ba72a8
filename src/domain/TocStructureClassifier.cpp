#include "domain/TocStructureClassifier.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace omnisplit::domain {

namespace {
    constexpr std::array<const char*, 6> kPlayKeywords = {
        "hamlet", "macbeth", "romeo", "juliet", "lear", "othello"
    };

    bool IsDelphiShape(const std::vector<TocEntry>& toc) {
        const TocEntry& first = toc.front();
        if (first.children.empty()) return false;
        return std::all_of(first.children.begin(), first.children.end(),
                           [](const TocEntry& child) { return child.isLeaf(); });
    }
}

bool TocStructureClassifier::MentionsKnownPlay(const std::string& title) {
    std::string lower = title;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return std::tolower(c); });
    for (const char* keyword : kPlayKeywords) {
        if (lower.find(keyword) != std::string::npos) return true;
    }
    return false;
}

TocType TocStructureClassifier::Classify(const std::vector<TocEntry>& toc) {
    if (toc.empty()) return TocType::Unknown;

    for (const auto& entry : toc) {
        if (entry.title && MentionsKnownPlay(*entry.title)) {
            return TocType::Shakespeare;
        }
    }

    if (IsDelphiShape(toc)) return TocType::DelphiClassics;
    if (toc.size() > 1) return TocType::Generic;
    return TocType::Unknown;
}

} // namespace omnisplit::domain
