/**
 * @file JsonVirtualBookRepository.cpp
 * @brief Implementation of JsonVirtualBookRepository.
 */

#include "infrastructure/JsonVirtualBookRepository.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "infrastructure/AtomicFile.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace omnisplit::infrastructure {

using domain::BookMetadata;
using domain::Omnibus;
using domain::VirtualBook;

namespace {
    constexpr int kFormatVersion = 1;

    long long ToMillis(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    std::chrono::system_clock::time_point FromMillis(long long ms) {
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
    }

    json MetadataToJson(const BookMetadata& m) {
        json j = {
            {"title", m.title},
            {"summary", m.summary},
            {"number", m.number},
            {"numberSort", m.numberSort},
            {"authors", m.authors},
            {"language", m.language},
            {"publisher", m.publisher}
        };
        if (m.releaseDate) j["releaseDate"] = *m.releaseDate;
        return j;
    }

    BookMetadata MetadataFromJson(const json& j) {
        BookMetadata m;
        m.title = j.value("title", "");
        m.summary = j.value("summary", "");
        m.number = j.value("number", "");
        m.numberSort = j.value("numberSort", 0.0f);
        m.authors = j.value("authors", std::vector<std::string>{});
        m.language = j.value("language", "");
        m.publisher = j.value("publisher", "");
        if (j.contains("releaseDate") && j["releaseDate"].is_string()) {
            m.releaseDate = j["releaseDate"].get<std::string>();
        }
        return m;
    }

    json BookToJson(const VirtualBook& b) {
        return {
            {"id", b.id},
            {"omnibusId", b.omnibusId},
            {"title", b.title},
            {"sortTitle", b.sortTitle},
            {"number", b.number},
            {"numberSort", b.numberSort},
            {"fileLastModified", ToMillis(b.fileLastModified)},
            {"fileSize", b.fileSize},
            {"url", b.url},
            {"metadata", MetadataToJson(b.metadata)}
        };
    }

    VirtualBook BookFromJson(const json& j) {
        VirtualBook b;
        b.id = j.at("id").get<std::string>();
        b.omnibusId = j.at("omnibusId").get<std::string>();
        b.title = j.value("title", "");
        b.sortTitle = j.value("sortTitle", b.title);
        b.number = j.value("number", 1.0f);
        b.numberSort = j.value("numberSort", b.number);
        b.fileLastModified = FromMillis(j.value("fileLastModified", 0LL));
        b.fileSize = j.value("fileSize", 0LL);
        b.url = j.value("url", "");
        if (j.contains("metadata")) b.metadata = MetadataFromJson(j["metadata"]);
        return b;
    }

    json OmnibusToJson(const Omnibus& o) {
        return {
            {"id", o.id},
            {"name", o.name},
            {"url", o.url},
            {"fileLastModified", ToMillis(o.fileLastModified)},
            {"fileSize", o.fileSize},
            {"metadata", MetadataToJson(o.metadata)}
        };
    }

    Omnibus OmnibusFromJson(const json& j) {
        Omnibus o;
        o.id = j.at("id").get<std::string>();
        o.name = j.value("name", "");
        o.url = j.value("url", "");
        o.fileLastModified = FromMillis(j.value("fileLastModified", 0LL));
        o.fileSize = j.value("fileSize", 0LL);
        if (j.contains("metadata")) o.metadata = MetadataFromJson(j["metadata"]);
        return o;
    }

    bool BookOrder(const VirtualBook& a, const VirtualBook& b) {
        if (a.numberSort != b.numberSort) return a.numberSort < b.numberSort;
        return a.id < b.id;
    }
}

JsonVirtualBookRepository::JsonVirtualBookRepository(fs::path storagePath)
    : m_storagePath(std::move(storagePath)) {
    load();
}

void JsonVirtualBookRepository::load() {
    if (!fs::exists(m_storagePath)) return;

    try {
        std::ifstream f(m_storagePath);
        json j = json::parse(f);

        for (const auto& o : j.value("omnibuses", json::array())) {
            Omnibus omnibus = OmnibusFromJson(o);
            m_omnibuses[omnibus.id] = omnibus;
        }
        for (const auto& b : j.value("virtualBooks", json::array())) {
            VirtualBook book = BookFromJson(b);
            m_books[book.id] = book;
        }
    } catch (const std::exception& e) {
        std::cerr << "[JsonVirtualBookRepository] Error loading " << m_storagePath << ": " << e.what() << std::endl;
        m_books.clear();
        m_omnibuses.clear();
    }
}

void JsonVirtualBookRepository::persistLocked() {
    json j;
    j["version"] = kFormatVersion;
    j["omnibuses"] = json::array();
    for (const auto& [id, omnibus] : m_omnibuses) {
        j["omnibuses"].push_back(OmnibusToJson(omnibus));
    }
    j["virtualBooks"] = json::array();
    for (const auto& [id, book] : m_books) {
        j["virtualBooks"].push_back(BookToJson(book));
    }
    AtomicFile::Write(m_storagePath, j.dump(4));
}

std::optional<VirtualBook> JsonVirtualBookRepository::findById(const std::string& virtualBookId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_books.find(virtualBookId);
    if (it == m_books.end()) return std::nullopt;
    return it->second;
}

std::vector<VirtualBook> JsonVirtualBookRepository::findByOmnibusId(const std::string& omnibusId) {
    std::vector<VirtualBook> result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, book] : m_books) {
            if (book.omnibusId == omnibusId) result.push_back(book);
        }
    }
    std::sort(result.begin(), result.end(), BookOrder);
    return result;
}

std::vector<VirtualBook> JsonVirtualBookRepository::findAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<VirtualBook> result;
    result.reserve(m_books.size());
    for (const auto& [id, book] : m_books) result.push_back(book);
    return result;
}

void JsonVirtualBookRepository::saveAll(const std::vector<VirtualBook>& books) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& book : books) {
        m_books[book.id] = book;
    }
    persistLocked();
}

void JsonVirtualBookRepository::deleteByOmnibusId(const std::string& omnibusId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t before = m_books.size();
    for (auto it = m_books.begin(); it != m_books.end();) {
        if (it->second.omnibusId == omnibusId) {
            it = m_books.erase(it);
        } else {
            ++it;
        }
    }
    if (m_books.size() != before) persistLocked();
}

bool JsonVirtualBookRepository::existsByOmnibusId(const std::string& omnibusId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::any_of(m_books.begin(), m_books.end(),
                       [&omnibusId](const auto& entry) { return entry.second.omnibusId == omnibusId; });
}

std::optional<Omnibus> JsonVirtualBookRepository::findOmnibus(const std::string& omnibusId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_omnibuses.find(omnibusId);
    if (it == m_omnibuses.end()) return std::nullopt;
    return it->second;
}

void JsonVirtualBookRepository::saveOmnibus(const Omnibus& omnibus) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_omnibuses[omnibus.id] = omnibus;
    persistLocked();
}

void JsonVirtualBookRepository::replaceByOmnibusId(const Omnibus& omnibus, const std::vector<VirtualBook>& books) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_omnibuses[omnibus.id] = omnibus;
    for (auto it = m_books.begin(); it != m_books.end();) {
        if (it->second.omnibusId == omnibus.id) {
            it = m_books.erase(it);
        } else {
            ++it;
        }
    }
    for (const auto& book : books) {
        m_books[book.id] = book;
    }
    persistLocked();
}

void JsonVirtualBookRepository::deleteOmnibus(const std::string& omnibusId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_omnibuses.erase(omnibusId);
    for (auto it = m_books.begin(); it != m_books.end();) {
        if (it->second.omnibusId == omnibusId) {
            it = m_books.erase(it);
        } else {
            ++it;
        }
    }
    persistLocked();
}

} // namespace omnisplit::infrastructure
