/**
 * @file EpubPackage.cpp
 * @brief OPF, nav and NCX parsing with pugixml.
 */

#include "infrastructure/EpubPackage.hpp"
#include <cstring>
#include <iostream>
#include <map>
#include <sstream>
#include <pugixml.hpp>
#include "domain/ContentErrors.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ZipArchive.hpp"

namespace omnisplit::infrastructure {

using domain::ContainerUnreadableError;
using domain::TocEntry;

namespace {
    // pugixml is not namespace aware; match "dc:title" and "title" alike.
    const char* LocalName(const pugi::xml_node& node) {
        const char* name = node.name();
        const char* colon = std::strchr(name, ':');
        return colon ? colon + 1 : name;
    }

    bool Is(const pugi::xml_node& node, const char* localName) {
        return node.type() == pugi::node_element && std::strcmp(LocalName(node), localName) == 0;
    }

    pugi::xml_node Child(const pugi::xml_node& parent, const char* localName) {
        for (pugi::xml_node c = parent.first_child(); c; c = c.next_sibling()) {
            if (Is(c, localName)) return c;
        }
        return pugi::xml_node();
    }

    pugi::xml_node Descendant(const pugi::xml_node& root, const char* localName) {
        return root.find_node([localName](pugi::xml_node n) { return Is(n, localName); });
    }

    void CollectText(const pugi::xml_node& node, std::string& out) {
        for (pugi::xml_node c = node.first_child(); c; c = c.next_sibling()) {
            if (c.type() == pugi::node_pcdata || c.type() == pugi::node_cdata) {
                out += c.value();
                out += ' ';
            } else if (c.type() == pugi::node_element) {
                CollectText(c, out);
            }
        }
    }

    // Text content with whitespace runs collapsed.
    std::string TextOf(const pugi::xml_node& node) {
        std::string raw;
        CollectText(node, raw);
        std::string out;
        bool pendingSpace = false;
        for (char c : raw) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                pendingSpace = !out.empty();
            } else {
                if (pendingSpace) out.push_back(' ');
                pendingSpace = false;
                out.push_back(c);
            }
        }
        return out;
    }

    std::optional<std::string> NonEmpty(std::string s) {
        if (s.empty()) return std::nullopt;
        return s;
    }

    bool HasToken(const std::string& list, const std::string& token) {
        std::istringstream in(list);
        std::string word;
        while (in >> word) {
            if (word == token) return true;
        }
        return false;
    }

    void ParseXml(pugi::xml_document& doc, const std::string& text, const std::string& what) {
        pugi::xml_parse_result result = doc.load_buffer(text.data(), text.size());
        if (!result) {
            throw ContainerUnreadableError(what + ": XML parse error: " + result.description());
        }
    }

    std::vector<TocEntry> ParseNavList(const pugi::xml_node& ol, const std::string& navHref) {
        std::vector<TocEntry> entries;
        for (pugi::xml_node li = ol.first_child(); li; li = li.next_sibling()) {
            if (!Is(li, "li")) continue;

            TocEntry entry;
            pugi::xml_node label = Child(li, "a");
            if (!label) label = Child(li, "span");
            if (label) {
                entry.title = NonEmpty(TextOf(label));
                pugi::xml_attribute href = label.attribute("href");
                if (href && Is(label, "a")) {
                    entry.href = EpubPackage::ResolveHref(navHref, href.value());
                }
            }
            if (pugi::xml_node nested = Child(li, "ol")) {
                entry.children = ParseNavList(nested, navHref);
            }
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    std::vector<TocEntry> ParseNavPoints(const pugi::xml_node& parent, const std::string& ncxHref) {
        std::vector<TocEntry> entries;
        for (pugi::xml_node point = parent.first_child(); point; point = point.next_sibling()) {
            if (!Is(point, "navPoint")) continue;

            TocEntry entry;
            if (pugi::xml_node label = Child(point, "navLabel")) {
                entry.title = NonEmpty(TextOf(Child(label, "text")));
            }
            if (pugi::xml_node content = Child(point, "content")) {
                pugi::xml_attribute src = content.attribute("src");
                if (src) entry.href = EpubPackage::ResolveHref(ncxHref, src.value());
            }
            entry.children = ParseNavPoints(point, ncxHref);
            entries.push_back(std::move(entry));
        }
        return entries;
    }
}

std::string EpubPackage::NormalizePath(const std::string& path) {
    std::vector<std::string> parts;
    std::string segment;
    std::istringstream in(path);
    while (std::getline(in, segment, '/')) {
        if (segment.empty() || segment == ".") continue;
        if (segment == ".." && !parts.empty() && parts.back() != "..") {
            parts.pop_back();
        } else {
            parts.push_back(segment);
        }
    }
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += '/';
        out += parts[i];
    }
    return out;
}

std::string EpubPackage::DirName(const std::string& path) {
    size_t slash = path.rfind('/');
    return slash == std::string::npos ? std::string() : path.substr(0, slash + 1);
}

std::string EpubPackage::ResolveHref(const std::string& baseHref, const std::string& reference) {
    std::string ref = reference;
    size_t cut = ref.find_first_of("#?");
    if (cut != std::string::npos) ref.erase(cut);
    ref = PathUtils::PercentDecode(ref);
    if (ref.empty()) return baseHref;
    if (ref[0] == '/') return NormalizePath(ref);
    return NormalizePath(DirName(baseHref) + ref);
}

const ManifestItem* EpubPackage::findByHref(const std::string& href) const {
    for (const auto& item : m_manifest) {
        if (item.href == href) return &item;
    }
    return nullptr;
}

std::string EpubPackage::archivePath(const std::string& href) const {
    return NormalizePath(m_opfDir + href);
}

EpubPackage EpubPackage::Load(const ZipReader& zip) {
    EpubPackage package;

    std::string containerXml;
    try {
        containerXml = zip.read("META-INF/container.xml");
    } catch (const std::exception& e) {
        throw ContainerUnreadableError(std::string("Missing META-INF/container.xml: ") + e.what());
    }

    pugi::xml_document container;
    ParseXml(container, containerXml, "META-INF/container.xml");
    pugi::xml_node rootfile = Descendant(container, "rootfile");
    std::string fullPath = rootfile ? rootfile.attribute("full-path").value() : "";
    if (fullPath.empty()) {
        throw ContainerUnreadableError("container.xml names no rootfile");
    }

    package.m_opfPath = NormalizePath(PathUtils::PercentDecode(fullPath));
    package.m_opfDir = DirName(package.m_opfPath);

    std::string opfXml;
    try {
        opfXml = zip.read(package.m_opfPath);
    } catch (const std::exception& e) {
        throw ContainerUnreadableError("Missing package document " + package.m_opfPath + ": " + e.what());
    }
    package.parseOpf(opfXml);
    package.parseToc(zip);
    return package;
}

void EpubPackage::parseOpf(const std::string& opfXml) {
    pugi::xml_document doc;
    ParseXml(doc, opfXml, m_opfPath);
    pugi::xml_node root = doc.document_element();
    if (!Is(root, "package")) {
        throw ContainerUnreadableError(m_opfPath + ": root element is not <package>");
    }

    if (pugi::xml_node metadata = Child(root, "metadata")) {
        for (pugi::xml_node n = metadata.first_child(); n; n = n.next_sibling()) {
            if (n.type() != pugi::node_element) continue;
            std::string text = TextOf(n);
            if (Is(n, "meta")) {
                if (std::string(n.attribute("property").value()) == "dcterms:modified" && !text.empty()) {
                    m_metadata.modified = text;
                }
                continue;
            }
            if (text.empty()) continue;
            if (Is(n, "title")) m_metadata.titles.push_back(text);
            else if (Is(n, "creator")) m_metadata.creators.push_back(text);
            else if (Is(n, "description")) m_metadata.descriptions.push_back(text);
            else if (Is(n, "language")) m_metadata.languages.push_back(text);
            else if (Is(n, "publisher")) m_metadata.publishers.push_back(text);
            else if (Is(n, "subject")) m_metadata.subjects.push_back(text);
            else if (Is(n, "date")) m_metadata.dates.push_back(text);
        }
    }

    pugi::xml_node manifest = Child(root, "manifest");
    if (!manifest) {
        throw ContainerUnreadableError(m_opfPath + ": no <manifest>");
    }
    std::map<std::string, std::string> hrefById;
    for (pugi::xml_node item = manifest.first_child(); item; item = item.next_sibling()) {
        if (!Is(item, "item")) continue;
        ManifestItem entry;
        entry.id = item.attribute("id").value();
        entry.href = NormalizePath(PathUtils::PercentDecode(item.attribute("href").value()));
        entry.mediaType = item.attribute("media-type").value();
        entry.properties = item.attribute("properties").value();
        if (entry.id.empty() || entry.href.empty()) continue;
        hrefById[entry.id] = entry.href;
        m_manifest.push_back(std::move(entry));
    }

    pugi::xml_node spine = Child(root, "spine");
    if (!spine) {
        throw ContainerUnreadableError(m_opfPath + ": no <spine>");
    }
    m_spineTocId = spine.attribute("toc").value();
    for (pugi::xml_node ref = spine.first_child(); ref; ref = ref.next_sibling()) {
        if (!Is(ref, "itemref")) continue;
        auto it = hrefById.find(ref.attribute("idref").value());
        if (it == hrefById.end()) {
            std::cerr << "[EpubPackage] Spine references unknown item '" << ref.attribute("idref").value() << "'" << std::endl;
            continue;
        }
        m_spine.push_back(it->second);
    }
}

void EpubPackage::parseToc(const ZipReader& zip) {
    const ManifestItem* nav = nullptr;
    const ManifestItem* ncx = nullptr;
    for (const auto& item : m_manifest) {
        if (!nav && HasToken(item.properties, "nav")) nav = &item;
        if (!ncx && (item.mediaType == "application/x-dtbncx+xml" || (!m_spineTocId.empty() && item.id == m_spineTocId))) {
            ncx = &item;
        }
    }

    if (nav) {
        try {
            if (parseNav(zip, *nav)) return;
        } catch (const std::exception& e) {
            std::cerr << "[EpubPackage] Ignoring unreadable navigation document: " << e.what() << std::endl;
        }
    }
    m_toc.clear();
    if (ncx) {
        try {
            if (parseNcx(zip, *ncx)) return;
        } catch (const std::exception& e) {
            std::cerr << "[EpubPackage] Ignoring unreadable NCX: " << e.what() << std::endl;
        }
    }
    m_toc.clear();
}

bool EpubPackage::parseNav(const ZipReader& zip, const ManifestItem& nav) {
    pugi::xml_document doc;
    ParseXml(doc, zip.read(archivePath(nav.href)), nav.href);

    pugi::xml_node tocNav = doc.find_node([](pugi::xml_node n) {
        return Is(n, "nav") && HasToken(n.attribute("epub:type").value(), "toc");
    });
    if (!tocNav) tocNav = Descendant(doc, "nav");
    if (!tocNav) return false;

    pugi::xml_node ol = Descendant(tocNav, "ol");
    if (!ol) return false;

    m_toc = ParseNavList(ol, nav.href);
    return !m_toc.empty();
}

bool EpubPackage::parseNcx(const ZipReader& zip, const ManifestItem& ncx) {
    pugi::xml_document doc;
    ParseXml(doc, zip.read(archivePath(ncx.href)), ncx.href);
    pugi::xml_node navMap = Descendant(doc, "navMap");
    if (!navMap) return false;

    m_toc = ParseNavPoints(navMap, ncx.href);
    return !m_toc.empty();
}

} // namespace omnisplit::infrastructure
