#pragma once

#include <string>

namespace omnisplit::domain {

/**
 * @brief Cleans up raw TOC labels into work titles.
 * Stateless; safe to call from any thread.
 */
class TitleNormalizer {
public:
    /**
     * @brief Normalizes a raw title.
     *
     * Steps, in order: leading numeric or Roman index ("12. ", "3 - ", "IV. "),
     * bracketed/parenthesized annotations, trailing punctuation, surrounding
     * whitespace. The steps repeat until nothing changes, so
     * Normalize(Normalize(x)) == Normalize(x). Never throws.
     */
    static std::string Normalize(const std::string& raw);
};

} // namespace omnisplit::domain
