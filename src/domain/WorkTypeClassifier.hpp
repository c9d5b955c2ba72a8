#pragma once

#include <string>
#include <vector>
#include "domain/Work.hpp"

namespace omnisplit::domain {

/**
 * @brief Infers a work's literary type from keywords in its title.
 */
class WorkTypeClassifier {
public:
    /**
     * @brief Ordered keyword rules over the lower-cased title; first match wins.
     * Falls back to WorkType::GenericEntry. Total, never throws.
     */
    static WorkType Classify(const std::string& title);

    /**
     * @brief Genre implied by a collection's own title or subjects
     * ("The Complete Poems", subject "Poetry").
     * @return GenericEntry when nothing matches.
     */
    static WorkType ClassifyCollection(const std::string& collectionTitle,
                                       const std::vector<std::string>& subjects = {});
};

} // namespace omnisplit::domain
