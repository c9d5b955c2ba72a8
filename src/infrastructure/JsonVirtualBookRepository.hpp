/**
 * @file JsonVirtualBookRepository.hpp
 * @brief VirtualBookRepository persisted to a single JSON document.
 */

#pragma once
#include <filesystem>
#include <map>
#include <mutex>
#include "domain/VirtualBookRepository.hpp"

namespace omnisplit::infrastructure {

/**
 * @class JsonVirtualBookRepository
 * @brief Thread-safe in-memory index written through to disk on every change.
 *
 * The file is replaced atomically (temp + rename), so a crash never leaves a
 * half-written index behind.
 */
class JsonVirtualBookRepository : public domain::VirtualBookRepository {
public:
    /**
     * @brief Loads @p storagePath if it exists.
     * An unreadable file is logged and the repository starts empty.
     */
    explicit JsonVirtualBookRepository(std::filesystem::path storagePath);

    std::optional<domain::VirtualBook> findById(const std::string& virtualBookId) override;
    std::vector<domain::VirtualBook> findByOmnibusId(const std::string& omnibusId) override;
    std::vector<domain::VirtualBook> findAll() override;

    /** @throws std::runtime_error if the index cannot be written. */
    void saveAll(const std::vector<domain::VirtualBook>& books) override;
    void deleteByOmnibusId(const std::string& omnibusId) override;
    bool existsByOmnibusId(const std::string& omnibusId) override;

    std::optional<domain::Omnibus> findOmnibus(const std::string& omnibusId) override;
    void saveOmnibus(const domain::Omnibus& omnibus) override;
    void replaceByOmnibusId(const domain::Omnibus& omnibus, const std::vector<domain::VirtualBook>& books) override;
    void deleteOmnibus(const std::string& omnibusId) override;

    const std::filesystem::path& storagePath() const { return m_storagePath; }

private:
    void load();
    void persistLocked();

    std::filesystem::path m_storagePath;
    std::map<std::string, domain::VirtualBook> m_books;
    std::map<std::string, domain::Omnibus> m_omnibuses;
    std::mutex m_mutex;
};

} // namespace omnisplit::infrastructure
