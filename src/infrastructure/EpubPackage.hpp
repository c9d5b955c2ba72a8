/**
 * @file EpubPackage.hpp
 * @brief Parsed OPF package of an EPUB archive: metadata, manifest, spine and TOC.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/TocEntry.hpp"

namespace omnisplit::infrastructure {

class ZipReader;

struct ManifestItem {
    std::string id;
    std::string href;       ///< OPF-relative, percent-decoded, normalized.
    std::string mediaType;
    std::string properties;

    bool isXhtml() const {
        return mediaType == "application/xhtml+xml" || mediaType == "text/html";
    }
};

struct PackageMetadata {
    std::vector<std::string> titles;
    std::vector<std::string> creators;
    std::vector<std::string> descriptions;
    std::vector<std::string> languages;
    std::vector<std::string> publishers;
    std::vector<std::string> subjects;
    std::vector<std::string> dates;
    std::optional<std::string> modified; ///< dcterms:modified
};

/**
 * @class EpubPackage
 * @brief Everything read from META-INF/container.xml and the OPF it points to.
 *
 * All hrefs (manifest, spine, TOC) share one form: relative to the OPF directory,
 * percent-decoded, without fragment. That lets TOC targets be compared with spine items.
 */
class EpubPackage {
public:
    /**
     * @brief Parses the package of an opened archive.
     * @throws domain::ContainerUnreadableError when container.xml or the OPF is
     * missing or malformed. A missing or broken TOC only yields an empty toc().
     */
    static EpubPackage Load(const ZipReader& zip);

    const std::string& opfPath() const { return m_opfPath; }
    const std::vector<ManifestItem>& manifest() const { return m_manifest; }
    const std::vector<std::string>& spine() const { return m_spine; }
    const PackageMetadata& metadata() const { return m_metadata; }
    const std::vector<domain::TocEntry>& toc() const { return m_toc; }

    const ManifestItem* findByHref(const std::string& href) const;

    /** @brief Zip entry name of an OPF-relative href. */
    std::string archivePath(const std::string& href) const;

    /** @brief Collapses "." and ".." segments. Leading ".." segments are kept. */
    static std::string NormalizePath(const std::string& path);

    /** @brief Directory part of a slash-separated path, with trailing slash, or "". */
    static std::string DirName(const std::string& path);

    /**
     * @brief Resolves @p reference found inside document @p baseHref.
     * Drops fragment and query and percent-decodes. A pure fragment resolves to @p baseHref.
     */
    static std::string ResolveHref(const std::string& baseHref, const std::string& reference);

private:
    void parseOpf(const std::string& opfXml);
    void parseToc(const ZipReader& zip);
    bool parseNav(const ZipReader& zip, const ManifestItem& nav);
    bool parseNcx(const ZipReader& zip, const ManifestItem& ncx);

    std::string m_opfPath;
    std::string m_opfDir;
    std::string m_spineTocId;
    std::vector<ManifestItem> m_manifest;
    std::vector<std::string> m_spine;
    PackageMetadata m_metadata;
    std::vector<domain::TocEntry> m_toc;
};

} // namespace omnisplit::infrastructure
