/**
 * @file TocEntry.hpp
 * @brief Raw table-of-contents node as parsed from a container.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace omnisplit::domain {

/**
 * @struct TocEntry
 * @brief One node of the container's navigation tree.
 *
 * Title and href are optional because real-world navigation documents
 * routinely omit either. The tree is never modified after parsing.
 */
struct TocEntry {
    std::optional<std::string> title; ///< Display label, if any.
    std::optional<std::string> href;  ///< Container-relative document path, fragment removed.
    std::vector<TocEntry> children;   ///< Nested entries in document order.

    TocEntry() = default;
    TocEntry(std::optional<std::string> t, std::optional<std::string> h, std::vector<TocEntry> c = {})
        : title(std::move(t)), href(std::move(h)), children(std::move(c)) {}

    bool isLeaf() const { return children.empty(); }
};

} // namespace omnisplit::domain
