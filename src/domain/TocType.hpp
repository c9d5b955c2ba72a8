/**
 * @file TocType.hpp
 * @brief Structural tag assigned to a table of contents.
 */

#pragma once
#include <string>

namespace omnisplit::domain {

/**
 * @enum TocType
 * @brief Derived classification of a TOC layout. Never persisted.
 */
enum class TocType {
    Shakespeare,    ///< Complete-works layout, plays as top-level entries.
    DelphiClassics, ///< Sections whose leaf children are the works.
    Generic,        ///< Each top-level entry is a work.
    Unknown         ///< No usable structure.
};

inline std::string TocTypeToString(TocType type) {
    switch (type) {
        case TocType::Shakespeare: return "SHAKESPEARE";
        case TocType::DelphiClassics: return "DELPHI_CLASSICS";
        case TocType::Generic: return "GENERIC";
        case TocType::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

} // namespace omnisplit::domain
