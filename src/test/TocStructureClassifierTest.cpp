#include <cassert>
#include <iostream>

#include "domain/TocStructureClassifier.hpp"

using namespace omnisplit::domain;

int main() {
    std::cout << "[Test] Starting TocStructureClassifier Test..." << std::endl;

    assert(TocStructureClassifier::Classify({}) == TocType::Unknown);

    // A single flat entry has no usable structure.
    assert(TocStructureClassifier::Classify({TocEntry("Walden", "walden.xhtml")}) == TocType::Unknown);

    std::vector<TocEntry> generic = {
        TocEntry("The Raven", "raven.xhtml"),
        TocEntry("Annabel Lee", "annabel.xhtml"),
    };
    assert(TocStructureClassifier::Classify(generic) == TocType::Generic);

    std::vector<TocEntry> delphi = {
        TocEntry("The Novels", "novels.xhtml", {
            TocEntry("Emma", "emma.xhtml"),
            TocEntry("Persuasion", "persuasion.xhtml"),
        }),
        TocEntry("The Letters", "letters.xhtml"),
    };
    assert(TocStructureClassifier::Classify(delphi) == TocType::DelphiClassics);

    // First entry with a nested grandchild is not the Delphi shape.
    std::vector<TocEntry> nested = {
        TocEntry("Part One", "p1.xhtml", {
            TocEntry("Book", "b.xhtml", {TocEntry("Chapter", "c.xhtml")}),
        }),
        TocEntry("Part Two", "p2.xhtml"),
    };
    assert(TocStructureClassifier::Classify(nested) == TocType::Generic);

    // A known play title outranks the Delphi shape.
    std::vector<TocEntry> shakespeare = delphi;
    shakespeare.push_back(TocEntry("The Tragedy of Hamlet, Prince of Denmark", "hamlet.xhtml"));
    assert(TocStructureClassifier::Classify(shakespeare) == TocType::Shakespeare);

    // Untitled entries are ignored by the play check.
    std::vector<TocEntry> untitled = {TocEntry(std::nullopt, "a.xhtml"), TocEntry("MACBETH", "m.xhtml")};
    assert(TocStructureClassifier::Classify(untitled) == TocType::Shakespeare);

    assert(TocStructureClassifier::MentionsKnownPlay("King Lear"));
    assert(!TocStructureClassifier::MentionsKnownPlay("The Tempest"));
    assert(TocTypeToString(TocType::DelphiClassics) == "DELPHI_CLASSICS");

    std::cout << "[PASS] TocStructureClassifier Test." << std::endl;
    return 0;
}
