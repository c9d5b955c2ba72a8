/**
 * @file EpubContainer.hpp
 * @brief Interfaces for opening an archive container and reading its structure.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/TocEntry.hpp"

namespace omnisplit::domain {

/**
 * @class EpubContainer
 * @brief Read-only view of an opened container: navigation, reading order and metadata.
 *
 * Metadata accessors are separate calls because each one may fail on its own
 * (malformed element, bad encoding). Callers treat those failures as "field absent".
 */
class EpubContainer {
public:
    virtual ~EpubContainer() = default;

    /** @brief Top-level entries of the table of contents, possibly empty. */
    virtual std::vector<TocEntry> toc() const = 0;

    /** @brief Container-relative hrefs of the reading-order spine. */
    virtual std::vector<std::string> spine() const = 0;

    virtual std::optional<std::string> title() const = 0;
    virtual std::vector<std::string> authors() const = 0;
    virtual std::optional<std::string> description() const = 0;
    virtual std::optional<std::string> language() const = 0;
    virtual std::vector<std::string> publishers() const = 0;

    /** @brief Subject keywords. Optional for implementations. */
    virtual std::vector<std::string> subjects() const { return {}; }
};

/**
 * @class ContainerReader
 * @brief Opens a container file.
 */
class ContainerReader {
public:
    virtual ~ContainerReader() = default;

    /**
     * @brief Opens and parses the container at @p path.
     * @throws ContainerUnreadableError if the file is not a readable container.
     */
    virtual std::unique_ptr<EpubContainer> open(const std::string& path) = 0;
};

} // namespace omnisplit::domain
