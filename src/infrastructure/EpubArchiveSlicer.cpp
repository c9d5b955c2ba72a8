/**
 * @file EpubArchiveSlicer.cpp
 * @brief Implementation of EpubArchiveSlicer.
 */

#include "infrastructure/EpubArchiveSlicer.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <deque>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <pugixml.hpp>
#include "infrastructure/EpubPackage.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ZipArchive.hpp"

namespace omnisplit::infrastructure {

using domain::TocEntry;
using domain::Work;

namespace {
    constexpr const char* kOutputDir = "OEBPS/";
    constexpr const char* kNavHref = "omnisplit-nav.xhtml";
    constexpr const char* kNcxHref = "omnisplit-toc.ncx";
    constexpr const char* kFallbackModified = "2000-01-01T00:00:00Z";

    const char* LocalName(const char* name) {
        const char* colon = std::strchr(name, ':');
        return colon ? colon + 1 : name;
    }

    bool IsRelativeReference(const std::string& ref) {
        if (ref.empty() || ref[0] == '#') return false;
        size_t colon = ref.find(':');
        size_t slash = ref.find('/');
        // "http:", "mailto:", "data:" and friends
        return colon == std::string::npos || (slash != std::string::npos && slash < colon);
    }

    std::string Trim(const std::string& s) {
        size_t b = 0, e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
        return s.substr(b, e - b);
    }

    std::string Unquote(std::string s) {
        s = Trim(s);
        if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
            s = s.substr(1, s.size() - 2);
        }
        return Trim(s);
    }

    // Deepest entry pointing at href: a section often shares its first child's
    // document, and only the child bounds that work.
    const TocEntry* FindEntry(const std::vector<TocEntry>& entries, const std::string& href) {
        for (const auto& entry : entries) {
            if (const TocEntry* nested = FindEntry(entry.children, href)) return nested;
            if (entry.href && *entry.href == href) return &entry;
        }
        return nullptr;
    }

    void CollectTargets(const TocEntry& entry, std::set<std::string>& out) {
        if (entry.href) out.insert(*entry.href);
        for (const auto& child : entry.children) CollectTargets(child, out);
    }

    std::string MetaValue(const Work& work, const std::string& key) {
        auto it = work.metadata.find(key);
        return it != work.metadata.end() ? it->second : std::string();
    }

    std::vector<std::string> Creators(const Work& work, const PackageMetadata& source) {
        std::vector<std::string> creators;
        auto addUnique = [&creators](const std::string& name) {
            if (!name.empty() && std::find(creators.begin(), creators.end(), name) == creators.end()) {
                creators.push_back(name);
            }
        };
        addUnique(MetaValue(work, "author"));
        for (int i = 0; work.metadata.count("author" + std::to_string(i)); ++i) {
            addUnique(MetaValue(work, "author" + std::to_string(i)));
        }
        if (creators.empty()) {
            for (const auto& c : source.creators) addUnique(c);
        }
        return creators;
    }

    std::string FirstOf(const std::string& preferred, const std::vector<std::string>& fallback) {
        if (!preferred.empty()) return preferred;
        return fallback.empty() ? std::string() : fallback.front();
    }

    std::string Serialize(pugi::xml_document& doc) {
        pugi::xml_node decl = doc.prepend_child(pugi::node_declaration);
        decl.append_attribute("version") = "1.0";
        decl.append_attribute("encoding") = "UTF-8";
        std::ostringstream out;
        doc.save(out, "  ", pugi::format_default, pugi::encoding_utf8);
        return out.str();
    }

    void AddDc(pugi::xml_node metadata, const char* name, const std::string& value) {
        if (value.empty()) return;
        metadata.append_child(name).text().set(value.c_str());
    }

    std::string ContainerXml() {
        pugi::xml_document doc;
        pugi::xml_node container = doc.append_child("container");
        container.append_attribute("version") = "1.0";
        container.append_attribute("xmlns") = "urn:oasis:names:tc:opendocument:xmlns:container";
        pugi::xml_node rootfile = container.append_child("rootfiles").append_child("rootfile");
        rootfile.append_attribute("full-path") = "OEBPS/content.opf";
        rootfile.append_attribute("media-type") = "application/oebps-package+xml";
        return Serialize(doc);
    }

    struct SliceLayout {
        std::string identifier;
        std::vector<std::string> documents;
        std::vector<std::string> resources;
    };

    std::string BuildOpf(const Work& work, const EpubPackage& package, const SliceLayout& layout) {
        const PackageMetadata& source = package.metadata();

        pugi::xml_document doc;
        pugi::xml_node root = doc.append_child("package");
        root.append_attribute("xmlns") = "http://www.idpf.org/2007/opf";
        root.append_attribute("version") = "3.0";
        root.append_attribute("unique-identifier") = "bookid";

        pugi::xml_node metadata = root.append_child("metadata");
        metadata.append_attribute("xmlns:dc") = "http://purl.org/dc/elements/1.1/";
        pugi::xml_node identifier = metadata.append_child("dc:identifier");
        identifier.append_attribute("id") = "bookid";
        identifier.text().set(layout.identifier.c_str());
        AddDc(metadata, "dc:title", work.title);
        for (const auto& creator : Creators(work, source)) AddDc(metadata, "dc:creator", creator);
        std::string language = FirstOf(MetaValue(work, "language"), source.languages);
        AddDc(metadata, "dc:language", language.empty() ? "en" : language);
        AddDc(metadata, "dc:publisher", FirstOf(MetaValue(work, "publisher"), source.publishers));
        AddDc(metadata, "dc:description", FirstOf(MetaValue(work, "description"), source.descriptions));
        for (const auto& subject : source.subjects) AddDc(metadata, "dc:subject", subject);

        pugi::xml_node modified = metadata.append_child("meta");
        modified.append_attribute("property") = "dcterms:modified";
        modified.text().set(source.modified.value_or(kFallbackModified).c_str());

        pugi::xml_node position = metadata.append_child("meta");
        position.append_attribute("name") = "omnisplit:position";
        position.append_attribute("content") = std::to_string(work.position).c_str();
        std::string section = MetaValue(work, "section");
        if (!section.empty()) {
            pugi::xml_node sectionMeta = metadata.append_child("meta");
            sectionMeta.append_attribute("name") = "omnisplit:section";
            sectionMeta.append_attribute("content") = section.c_str();
        }

        pugi::xml_node manifest = root.append_child("manifest");
        pugi::xml_node nav = manifest.append_child("item");
        nav.append_attribute("id") = "omnisplit-nav";
        nav.append_attribute("href") = kNavHref;
        nav.append_attribute("media-type") = "application/xhtml+xml";
        nav.append_attribute("properties") = "nav";
        pugi::xml_node ncx = manifest.append_child("item");
        ncx.append_attribute("id") = "omnisplit-ncx";
        ncx.append_attribute("href") = kNcxHref;
        ncx.append_attribute("media-type") = "application/x-dtbncx+xml";

        auto addItem = [&](const std::string& href) {
            const ManifestItem* original = package.findByHref(href);
            pugi::xml_node item = manifest.append_child("item");
            item.append_attribute("id") = original->id.c_str();
            item.append_attribute("href") = PathUtils::PercentEncode(href, true).c_str();
            item.append_attribute("media-type") = original->mediaType.c_str();
            // Our own navigation document replaces the source one.
            std::istringstream props(original->properties);
            std::string kept, word;
            while (props >> word) {
                if (word == "nav") continue;
                if (!kept.empty()) kept += ' ';
                kept += word;
            }
            if (!kept.empty()) item.append_attribute("properties") = kept.c_str();
        };
        for (const auto& href : layout.documents) addItem(href);
        for (const auto& href : layout.resources) addItem(href);

        pugi::xml_node spine = root.append_child("spine");
        spine.append_attribute("toc") = "omnisplit-ncx";
        for (const auto& href : layout.documents) {
            spine.append_child("itemref").append_attribute("idref") = package.findByHref(href)->id.c_str();
        }
        return Serialize(doc);
    }

    std::string BuildNav(const Work& work, const std::string& firstDocument) {
        pugi::xml_document doc;
        pugi::xml_node html = doc.append_child("html");
        html.append_attribute("xmlns") = "http://www.w3.org/1999/xhtml";
        html.append_attribute("xmlns:epub") = "http://www.idpf.org/2007/ops";
        html.append_child("head").append_child("title").text().set(work.title.c_str());
        pugi::xml_node nav = html.append_child("body").append_child("nav");
        nav.append_attribute("epub:type") = "toc";
        nav.append_attribute("id") = "toc";
        pugi::xml_node a = nav.append_child("ol").append_child("li").append_child("a");
        a.append_attribute("href") = PathUtils::PercentEncode(firstDocument, true).c_str();
        a.text().set(work.title.c_str());
        return Serialize(doc);
    }

    std::string BuildNcx(const Work& work, const std::string& identifier, const std::string& firstDocument) {
        pugi::xml_document doc;
        pugi::xml_node ncx = doc.append_child("ncx");
        ncx.append_attribute("xmlns") = "http://www.daisy.org/z3986/2005/ncx/";
        ncx.append_attribute("version") = "2005-1";
        pugi::xml_node uid = ncx.append_child("head").append_child("meta");
        uid.append_attribute("name") = "dtb:uid";
        uid.append_attribute("content") = identifier.c_str();
        ncx.append_child("docTitle").append_child("text").text().set(work.title.c_str());
        pugi::xml_node point = ncx.append_child("navMap").append_child("navPoint");
        point.append_attribute("id") = "navpoint-1";
        point.append_attribute("playOrder") = "1";
        point.append_child("navLabel").append_child("text").text().set(work.title.c_str());
        point.append_child("content").append_attribute("src") = PathUtils::PercentEncode(firstDocument, true).c_str();
        return Serialize(doc);
    }

    void CollectXhtmlReferences(const pugi::xml_node& node, std::vector<std::string>& out) {
        for (pugi::xml_node c = node.first_child(); c; c = c.next_sibling()) {
            if (c.type() != pugi::node_element) continue;
            const char* element = LocalName(c.name());
            bool isAnchor = std::strcmp(element, "a") == 0 || std::strcmp(element, "area") == 0;

            for (pugi::xml_attribute attr = c.first_attribute(); attr; attr = attr.next_attribute()) {
                std::string name = attr.name();
                if (name == "src" || name == "xlink:href" || name == "data-src" || name == "poster" ||
                    (name == "href" && !isAnchor)) {
                    out.emplace_back(attr.value());
                } else if (name == "style") {
                    auto css = EpubArchiveSlicer::CssReferences(attr.value());
                    out.insert(out.end(), css.begin(), css.end());
                }
            }
            if (std::strcmp(element, "style") == 0) {
                auto css = EpubArchiveSlicer::CssReferences(c.text().get());
                out.insert(out.end(), css.begin(), css.end());
            }
            CollectXhtmlReferences(c, out);
        }
    }
}

std::vector<std::string> EpubArchiveSlicer::CssReferences(const std::string& css) {
    std::vector<std::string> refs;

    size_t pos = 0;
    while ((pos = css.find("url(", pos)) != std::string::npos) {
        size_t close = css.find(')', pos + 4);
        if (close == std::string::npos) break;
        refs.push_back(Unquote(css.substr(pos + 4, close - pos - 4)));
        pos = close + 1;
    }

    pos = 0;
    while ((pos = css.find("@import", pos)) != std::string::npos) {
        size_t start = pos + 7;
        while (start < css.size() && std::isspace(static_cast<unsigned char>(css[start]))) ++start;
        if (start < css.size() && (css[start] == '"' || css[start] == '\'')) {
            size_t end = css.find(css[start], start + 1);
            if (end == std::string::npos) break;
            refs.push_back(css.substr(start + 1, end - start - 1));
            pos = end + 1;
        } else {
            pos = start; // url(...) form, already collected above
        }
    }

    refs.erase(std::remove_if(refs.begin(), refs.end(), [](const std::string& r) { return !IsRelativeReference(r); }),
               refs.end());
    return refs;
}

std::vector<std::string> EpubArchiveSlicer::XhtmlReferences(const std::string& xhtml) {
    std::vector<std::string> refs;
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xhtml.data(), xhtml.size());
    if (!result) {
        std::cerr << "[EpubArchiveSlicer] Cannot parse document, its resources are skipped: "
                  << result.description() << std::endl;
        return refs;
    }
    CollectXhtmlReferences(doc, refs);
    refs.erase(std::remove_if(refs.begin(), refs.end(), [](const std::string& r) { return !IsRelativeReference(r); }),
               refs.end());
    return refs;
}

std::vector<std::string> EpubArchiveSlicer::SelectDocuments(const EpubPackage& package, const std::string& href) {
    const auto& spine = package.spine();
    auto start = std::find(spine.begin(), spine.end(), href);
    if (start == spine.end()) {
        if (package.findByHref(href)) return {href};
        throw std::runtime_error("Work document '" + href + "' is not part of the container");
    }

    const TocEntry* entry = FindEntry(package.toc(), href);
    if (!entry) return {href};

    std::set<std::string> inside;
    CollectTargets(*entry, inside);
    std::set<std::string> allTargets;
    for (const auto& top : package.toc()) CollectTargets(top, allTargets);

    std::vector<std::string> documents{href};
    for (auto it = start + 1; it != spine.end(); ++it) {
        if (allTargets.count(*it) && !inside.count(*it)) break;
        if (std::find(documents.begin(), documents.end(), *it) != documents.end()) break;
        documents.push_back(*it);
    }
    return documents;
}

void EpubArchiveSlicer::extract(const Work& work,
                                const std::filesystem::path& sourceContainer,
                                const std::filesystem::path& destPath,
                                const domain::CancellationToken& cancel) {
    cancel.throwIfCancelled(work.title);

    ZipReader source(sourceContainer);
    EpubPackage package = EpubPackage::Load(source);

    SliceLayout layout;
    layout.identifier = "urn:omnisplit:" + PathUtils::PercentEncode(sourceContainer.filename().string(), false) +
                        ":" + PathUtils::PercentEncode(work.href, true);
    layout.documents = SelectDocuments(package, work.href);

    // Resources referenced from the selected documents, transitively through CSS.
    const std::set<std::string> spineDocs(package.spine().begin(), package.spine().end());
    std::set<std::string> taken(layout.documents.begin(), layout.documents.end());
    std::set<std::string> resources;
    std::map<std::string, std::string> contents;
    std::deque<std::string> toScan(layout.documents.begin(), layout.documents.end());

    while (!toScan.empty()) {
        cancel.throwIfCancelled(work.title);
        std::string href = toScan.front();
        toScan.pop_front();

        const ManifestItem* item = package.findByHref(href);
        std::string data = source.read(package.archivePath(href));

        std::vector<std::string> refs;
        if (item && item->isXhtml()) {
            refs = XhtmlReferences(data);
        } else if (item && item->mediaType == "text/css") {
            refs = CssReferences(data);
        }
        contents[href] = std::move(data);

        for (const auto& ref : refs) {
            std::string target = EpubPackage::ResolveHref(href, ref);
            if (taken.count(target) || !package.findByHref(target)) continue;
            if (spineDocs.count(target)) continue; // another work's document
            taken.insert(target);
            resources.insert(target);
            toScan.push_back(target);
        }
    }
    layout.resources.assign(resources.begin(), resources.end());

    ZipWriter writer(destPath);
    writer.add("mimetype", "application/epub+zip", true);
    writer.add("META-INF/container.xml", ContainerXml());
    writer.add(std::string(kOutputDir) + "content.opf", BuildOpf(work, package, layout));
    writer.add(std::string(kOutputDir) + kNcxHref, BuildNcx(work, layout.identifier, layout.documents.front()));
    writer.add(std::string(kOutputDir) + kNavHref, BuildNav(work, layout.documents.front()));

    auto addEntry = [&](const std::string& href) {
        cancel.throwIfCancelled(work.title);
        writer.add(EpubPackage::NormalizePath(kOutputDir + href), std::move(contents[href]));
    };
    for (const auto& href : layout.documents) addEntry(href);
    for (const auto& href : layout.resources) addEntry(href);

    cancel.throwIfCancelled(work.title);
    writer.close();
}

} // namespace omnisplit::infrastructure
