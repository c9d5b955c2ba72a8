/**
 * @file VirtualBookRepository.hpp
 * @brief Interface for persistence and lookup of omnibus and virtual book records.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/VirtualBook.hpp"

namespace omnisplit::domain {

/**
 * @class VirtualBookRepository
 * @brief Abstract store of Omnibus and VirtualBook records.
 */
class VirtualBookRepository {
public:
    virtual ~VirtualBookRepository() = default;

    /** @brief Fetches a single virtual book. */
    virtual std::optional<VirtualBook> findById(const std::string& virtualBookId) = 0;

    /** @brief All virtual books of an omnibus, ordered by numberSort then id. */
    virtual std::vector<VirtualBook> findByOmnibusId(const std::string& omnibusId) = 0;

    virtual std::vector<VirtualBook> findAll() = 0;

    /**
     * @brief Stores every book in @p books, replacing records with the same id.
     */
    virtual void saveAll(const std::vector<VirtualBook>& books) = 0;

    /** @brief Removes every virtual book owned by @p omnibusId. */
    virtual void deleteByOmnibusId(const std::string& omnibusId) = 0;

    virtual bool existsByOmnibusId(const std::string& omnibusId) = 0;

    virtual std::optional<Omnibus> findOmnibus(const std::string& omnibusId) = 0;
    virtual void saveOmnibus(const Omnibus& omnibus) = 0;

    /**
     * @brief Stores @p omnibus and makes @p books its complete set of virtual books.
     * Readers see either the previous set or the new one, never a mix or nothing.
     */
    virtual void replaceByOmnibusId(const Omnibus& omnibus, const std::vector<VirtualBook>& books) = 0;

    /** @brief Removes the omnibus record and all of its virtual books. */
    virtual void deleteOmnibus(const std::string& omnibusId) = 0;

    /**
     * @brief Resolves a virtual book together with its owning omnibus.
     * @return nullopt if either record is unknown.
     */
    virtual std::optional<VirtualBookWithOmnibus> resolveVirtualBook(const std::string& virtualBookId) {
        auto book = findById(virtualBookId);
        if (!book) return std::nullopt;
        auto omnibus = findOmnibus(book->omnibusId);
        if (!omnibus) return std::nullopt;
        return VirtualBookWithOmnibus{*book, *omnibus};
    }
};

} // namespace omnisplit::domain
