#include "domain/WorkTypeClassifier.hpp"
#include <algorithm>
#include <cctype>

namespace omnisplit::domain {

namespace {
    std::string ToLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
        return s;
    }

    bool Contains(const std::string& haystack, const char* needle) {
        return haystack.find(needle) != std::string::npos;
    }

    WorkType ClassifyGenreText(const std::string& lower) {
        if (Contains(lower, "poem") || Contains(lower, "poetry")) return WorkType::Poem;
        if (Contains(lower, "play") || Contains(lower, "drama")) return WorkType::Play;
        if (Contains(lower, "essay")) return WorkType::Essay;
        if (Contains(lower, "letter") || Contains(lower, "correspondence")) return WorkType::Letter;
        if (Contains(lower, "short stor") || Contains(lower, "tales")) return WorkType::ShortStory;
        if (Contains(lower, "novel")) return WorkType::Novel;
        return WorkType::GenericEntry;
    }
}

WorkType WorkTypeClassifier::Classify(const std::string& title) {
    const std::string lower = ToLower(title);

    if (Contains(lower, "sonnet")) return WorkType::Poem;
    if (Contains(lower, "poem")) return WorkType::Poem;
    if (Contains(lower, "play")) return WorkType::Play;
    if (Contains(lower, "act") && Contains(lower, "scene")) return WorkType::Play;
    if (Contains(lower, "essay")) return WorkType::Essay;
    if (Contains(lower, "letter")) return WorkType::Letter;
    if (Contains(lower, "chapter")) return WorkType::DelphiChapter;
    if (Contains(lower, "short") && Contains(lower, "story")) return WorkType::ShortStory;
    if (Contains(lower, "novel")) return WorkType::Novel;
    return WorkType::GenericEntry;
}

WorkType WorkTypeClassifier::ClassifyCollection(const std::string& collectionTitle,
                                                const std::vector<std::string>& subjects) {
    WorkType fromTitle = ClassifyGenreText(ToLower(collectionTitle));
    if (fromTitle != WorkType::GenericEntry) return fromTitle;

    for (const auto& subject : subjects) {
        WorkType fromSubject = ClassifyGenreText(ToLower(subject));
        if (fromSubject != WorkType::GenericEntry) return fromSubject;
    }
    return WorkType::GenericEntry;
}

} // namespace omnisplit::domain
