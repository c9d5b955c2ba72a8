/**
 * @file TocStructureClassifier.hpp
 * @brief Structural classification of a parsed table of contents.
 */

#pragma once
#include <vector>
#include "domain/TocEntry.hpp"
#include "domain/TocType.hpp"

namespace omnisplit::domain {

/**
 * @class TocStructureClassifier
 * @brief Decides which work-extraction strategy fits a TOC tree.
 *
 * Rules, first match wins:
 * 1. Empty TOC -> Unknown.
 * 2. A first-level title names a known play -> Shakespeare. Runs before the
 *    shape checks because complete-works layouts also match the Delphi shape.
 * 3. First entry has children and all of them are leaves -> DelphiClassics.
 * 4. More than one top-level entry -> Generic.
 * 5. Otherwise Unknown.
 */
class TocStructureClassifier {
public:
    static TocType Classify(const std::vector<TocEntry>& toc);

    /** @brief True if the lower-cased title contains one of the known play keywords. */
    static bool MentionsKnownPlay(const std::string& title);
};

} // namespace omnisplit::domain
