/**
 * @file EpubArchiveSlicer.hpp
 * @brief Writes one work of an EPUB omnibus as a standalone EPUB (libzip + pugixml).
 */

#pragma once
#include <string>
#include <vector>
#include "domain/ArchiveSlicer.hpp"

namespace omnisplit::infrastructure {

class EpubPackage;

/**
 * @class EpubArchiveSlicer
 * @brief ArchiveSlicer producing reproducible EPUB 3 archives with an NCX fallback.
 *
 * Content documents and resources keep their OPF-relative paths so relative
 * links inside them stay valid. Entry order and timestamps are fixed, so the
 * same input always gives the same bytes.
 */
class EpubArchiveSlicer : public domain::ArchiveSlicer {
public:
    void extract(const domain::Work& work,
                 const std::filesystem::path& sourceContainer,
                 const std::filesystem::path& destPath,
                 const domain::CancellationToken& cancel) override;

    /**
     * @brief Spine documents making up the work that starts at @p href.
     *
     * Takes the spine run from @p href up to the next document targeted by a
     * TOC entry outside the subtree of the entry for @p href. An href no TOC
     * entry targets yields just that document.
     * @throws std::runtime_error if @p href is not in the manifest.
     */
    static std::vector<std::string> SelectDocuments(const EpubPackage& package, const std::string& href);

    /** @brief Relative references in an XHTML document (src, href outside <a>, xlink:href, data-src, CSS). */
    static std::vector<std::string> XhtmlReferences(const std::string& xhtml);

    /** @brief url(...) and @import targets of a stylesheet. */
    static std::vector<std::string> CssReferences(const std::string& css);
};

} // namespace omnisplit::infrastructure
