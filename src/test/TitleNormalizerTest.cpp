#include <cassert>
#include <iostream>

#include "domain/TitleNormalizer.hpp"
#include "domain/WorkTypeClassifier.hpp"

using namespace omnisplit::domain;

int main() {
    std::cout << "[Test] Starting TitleNormalizer Test..." << std::endl;

    assert(TitleNormalizer::Normalize("1. The Tempest (1611)") == "The Tempest");
    assert(TitleNormalizer::Normalize("  12 - Hamlet [First Folio].  ") == "Hamlet");
    assert(TitleNormalizer::Normalize("IV. The Raven") == "The Raven");
    assert(TitleNormalizer::Normalize("3\xE2\x80\x94" "Annabel Lee;") == "Annabel Lee");
    assert(TitleNormalizer::Normalize("") == "");
    assert(TitleNormalizer::Normalize("   ") == "");

    // Words that merely look like indices survive.
    assert(TitleNormalizer::Normalize("I Am Legend") == "I Am Legend");
    assert(TitleNormalizer::Normalize("1984") == "1984");
    assert(TitleNormalizer::Normalize("Catch-22") == "Catch-22");

    // Annotation removal may expose another index.
    assert(TitleNormalizer::Normalize("(Part 2) 5. Emma") == "Emma");

    // Unbalanced brackets stay.
    assert(TitleNormalizer::Normalize("Notes (draft") == "Notes (draft");

    const char* samples[] = {"1. The Tempest (1611)", "IV. The Raven", "(x) 2. [y] Z.", "Hamlet", "  7 - 8. Nine  "};
    for (const char* s : samples) {
        std::string once = TitleNormalizer::Normalize(s);
        assert(TitleNormalizer::Normalize(once) == once && "Normalize must be idempotent.");
    }
    std::cout << "[PASS] TitleNormalizer Test." << std::endl;

    std::cout << "[Test] Starting WorkTypeClassifier Test..." << std::endl;

    assert(WorkTypeClassifier::Classify("Sonnet 18") == WorkType::Poem);
    assert(WorkTypeClassifier::Classify("Selected Poems") == WorkType::Poem);
    assert(WorkTypeClassifier::Classify("A Play in Three Parts") == WorkType::Play);
    assert(WorkTypeClassifier::Classify("Act I, Scene 2") == WorkType::Play);
    assert(WorkTypeClassifier::Classify("An Essay on Man") == WorkType::Essay);
    assert(WorkTypeClassifier::Classify("Letter to a Friend") == WorkType::Letter);
    assert(WorkTypeClassifier::Classify("Chapter One") == WorkType::DelphiChapter);
    assert(WorkTypeClassifier::Classify("A Short Story") == WorkType::ShortStory);
    assert(WorkTypeClassifier::Classify("The Great Novel") == WorkType::Novel);
    assert(WorkTypeClassifier::Classify("Hamlet") == WorkType::GenericEntry);
    assert(WorkTypeClassifier::Classify("") == WorkType::GenericEntry);

    // "sonnet" wins over "play" since it is checked first.
    assert(WorkTypeClassifier::Classify("Sonnets from a Play") == WorkType::Poem);

    assert(WorkTypeClassifier::ClassifyCollection("The Complete Poems of Edgar Allan Poe") == WorkType::Poem);
    assert(WorkTypeClassifier::ClassifyCollection("Collected Works", {"Fiction", "Drama"}) == WorkType::Play);
    assert(WorkTypeClassifier::ClassifyCollection("Collected Works", {"Fiction"}) == WorkType::GenericEntry);
    assert(WorkTypeClassifier::ClassifyCollection("Tales of Mystery") == WorkType::ShortStory);

    assert(WorkTypeToString(WorkType::ShortStory) == "SHORT_STORY");
    assert(WorkTypeToString(WorkType::DelphiChapter) == "DELPHI_CHAPTER");

    std::cout << "[PASS] WorkTypeClassifier Test." << std::endl;
    return 0;
}
