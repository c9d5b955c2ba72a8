/**
 * @file VirtualBook.hpp
 * @brief Durable records for omnibus containers and the works carved out of them.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace omnisplit::domain {

/**
 * @struct BookMetadata
 * @brief Descriptive metadata stored alongside a book record.
 */
struct BookMetadata {
    std::string title;
    std::string summary;
    std::string number;
    float numberSort = 0.0f;
    std::vector<std::string> authors;
    std::string language;
    std::string publisher;
    std::optional<std::string> releaseDate; ///< ISO date, when known.

    bool operator==(const BookMetadata& o) const {
        return title == o.title && summary == o.summary && number == o.number &&
               numberSort == o.numberSort && authors == o.authors && language == o.language &&
               publisher == o.publisher && releaseDate == o.releaseDate;
    }
};

/**
 * @struct Omnibus
 * @brief The owning container record (one physical archive on disk).
 */
struct Omnibus {
    std::string id;
    std::string name;
    std::string url; ///< file: URL or absolute path of the archive.
    std::chrono::system_clock::time_point fileLastModified{};
    long long fileSize = 0;
    BookMetadata metadata;
};

/**
 * @struct VirtualBook
 * @brief One work logically carved out of an omnibus.
 *
 * Created when an omnibus is scanned, replaced on re-scan and removed with the
 * omnibus. omnibusId is a lookup key only; the record never owns the container.
 */
struct VirtualBook {
    std::string id;
    std::string omnibusId;
    std::string title;
    std::string sortTitle;
    float number = 1.0f;
    float numberSort = 1.0f;
    std::chrono::system_clock::time_point fileLastModified{};
    long long fileSize = 0;
    BookMetadata metadata;
    std::string url; ///< Container location, with "#<href>" addressing the work inside it.
};

/**
 * @struct VirtualBookWithOmnibus
 * @brief Result of resolving a virtual book together with its container.
 */
struct VirtualBookWithOmnibus {
    VirtualBook virtualBook;
    Omnibus omnibus;
};

} // namespace omnisplit::domain
