/**
 * @file Work.hpp
 * @brief Domain value describing one logical work carved out of an omnibus.
 */

#pragma once
#include <map>
#include <string>

namespace omnisplit::domain {

/**
 * @enum WorkType
 * @brief Literary type inferred for a work.
 */
enum class WorkType {
    Novel,
    ShortStory,
    Essay,
    Play,
    Poem,
    Letter,
    DelphiChapter,
    GenericEntry,
    Other
};

inline std::string WorkTypeToString(WorkType type) {
    switch (type) {
        case WorkType::Novel: return "NOVEL";
        case WorkType::ShortStory: return "SHORT_STORY";
        case WorkType::Essay: return "ESSAY";
        case WorkType::Play: return "PLAY";
        case WorkType::Poem: return "POEM";
        case WorkType::Letter: return "LETTER";
        case WorkType::DelphiChapter: return "DELPHI_CHAPTER";
        case WorkType::GenericEntry: return "GENERIC_ENTRY";
        case WorkType::Other: return "OTHER";
    }
    return "OTHER";
}

/**
 * @struct Work
 * @brief A work inside an omnibus, produced per extraction run.
 *
 * Works are ephemeral. The scan pipeline persists them as VirtualBook records.
 */
struct Work {
    std::string title;                           ///< Already normalized.
    std::string href;                            ///< Document where the work starts.
    int position = 1;                            ///< 1-based order of appearance.
    WorkType type = WorkType::GenericEntry;
    std::map<std::string, std::string> metadata; ///< author, section, language, ...

    bool operator==(const Work& other) const {
        return title == other.title && href == other.href && position == other.position &&
               type == other.type && metadata == other.metadata;
    }
};

} // namespace omnisplit::domain
