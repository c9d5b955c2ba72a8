/**
 * @file EpubContainerReader.hpp
 * @brief ContainerReader for EPUB 2 and EPUB 3 archives (libzip + pugixml).
 */

#pragma once
#include <memory>
#include <string>
#include "domain/EpubContainer.hpp"

namespace omnisplit::infrastructure {

/**
 * @class EpubContainerReader
 * @brief Opens an EPUB, reading its package and TOC eagerly.
 *
 * The returned container holds parsed data only; the archive is closed before
 * open() returns. TOC comes from the EPUB 3 navigation document when present,
 * otherwise from the NCX.
 */
class EpubContainerReader : public domain::ContainerReader {
public:
    /** @throws domain::ContainerUnreadableError for non-zip files or a missing/invalid package. */
    std::unique_ptr<domain::EpubContainer> open(const std::string& path) override;
};

} // namespace omnisplit::infrastructure
