/**
 * @file SubdocumentExtractionService.hpp
 * @brief Materializes virtual books as cached standalone archives.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "application/AsyncTaskManager.hpp"
#include "domain/ArchiveSlicer.hpp"
#include "domain/CancellationToken.hpp"
#include "domain/ContentResource.hpp"
#include "domain/VirtualBookRepository.hpp"
#include "domain/Work.hpp"

namespace omnisplit::application {

/**
 * @struct ExtractionServiceOptions
 * @brief Per-instance settings; the cache root is never global.
 */
struct ExtractionServiceOptions {
    std::filesystem::path cacheDirectory;
    std::chrono::milliseconds defaultTimeout{0}; ///< 0 = unbounded
    bool revalidateAgainstSource = true;         ///< Cache older than its container is a miss.
};

/**
 * @class SubdocumentExtractionService
 * @brief Cache-backed, single-flight extraction of virtual books.
 *
 * Cache files are named "<omnibus stem>-<virtual book id>.epub". A miss runs the
 * slicer on the worker pool into "<final>.part-<n>" and renames the result into
 * place, so a final-named file is always complete. Concurrent requests for the
 * same key share one slicer run.
 *
 * Errors: ContentNotFoundError for unknown ids or missing containers,
 * ExtractionFailedError / ExtractionTimeoutError for slicer failures,
 * ResourceAccessError when the cached file cannot be opened.
 */
class SubdocumentExtractionService {
public:
    SubdocumentExtractionService(std::shared_ptr<domain::VirtualBookRepository> repository,
                                 std::shared_ptr<domain::ArchiveSlicer> slicer,
                                 std::shared_ptr<AsyncTaskManager> taskManager,
                                 ExtractionServiceOptions options);

    /** @brief Waits for extractions still running on the pool. */
    ~SubdocumentExtractionService();

    SubdocumentExtractionService(const SubdocumentExtractionService&) = delete;
    SubdocumentExtractionService& operator=(const SubdocumentExtractionService&) = delete;

    /** @brief getContent with the configured default timeout. */
    domain::ContentResource getContent(const std::string& virtualBookId);

    /**
     * @brief Returns the cached sub-document, extracting it on a miss.
     * @param timeout 0 waits without bound. On expiry this caller stops waiting;
     * the extraction is cancelled, and its partial output removed by the worker,
     * only once every caller sharing it has given up.
     * @throws ExtractionTimeoutError when @p timeout elapses first.
     */
    domain::ContentResource getContent(const std::string& virtualBookId, std::chrono::milliseconds timeout);

    /** @brief getContent(id) on a separate thread. */
    std::future<domain::ContentResource> getContentAsync(const std::string& virtualBookId);

    /** @brief True if the id resolves and its container exists on disk. Never throws. */
    bool contentExists(const std::string& virtualBookId);

    /**
     * @brief Deletes cache files whose age is >= @p maxAgeHours.
     * Negative ages count as 0, so cleanupCache(0) empties the cache. Temp files
     * and files of running extractions are skipped. Failures are logged.
     * @return Number of files removed.
     */
    size_t cleanupCache(double maxAgeHours);

    /** @brief Same as cleanupCache(double) with an explicit "now". */
    size_t cleanupCache(double maxAgeHours, std::filesystem::file_time_type now);

    /** @brief Removes every cached file of @p omnibus. @return Files removed. */
    size_t evictOmnibus(const domain::Omnibus& omnibus);

    /**
     * @brief The cache root, created with owner rwx on first use.
     * @throws ExtractionFailedError if it cannot be created.
     */
    std::filesystem::path cacheDirectory();

    /** @brief "<stem of omnibusPath>-<percent-encoded id>.epub". */
    static std::string cacheFileName(const std::filesystem::path& omnibusPath, const std::string& virtualBookId);

    /** @brief Work descriptor rebuilt from a stored virtual book. */
    static domain::Work ToWork(const domain::VirtualBook& book);

private:
    struct Flight {
        std::shared_future<void> done;
        domain::CancellationToken cancel;
        int waiters = 0; ///< Callers still blocked on done; the last to time out cancels.
    };

    std::filesystem::path resolveContainer(const domain::VirtualBookWithOmnibus& resolved) const;
    bool isFreshLocked(const std::filesystem::path& cached, const std::filesystem::path& source) const;
    void runExtraction(const domain::Work& work,
                       const std::filesystem::path& source,
                       const std::filesystem::path& finalPath,
                       const domain::CancellationToken& cancel,
                       const std::shared_ptr<std::promise<void>>& promise);
    bool isProtectedLocked(const std::filesystem::path& file) const;

    std::shared_ptr<domain::VirtualBookRepository> m_repository;
    std::shared_ptr<domain::ArchiveSlicer> m_slicer;
    std::shared_ptr<AsyncTaskManager> m_taskManager;
    ExtractionServiceOptions m_options;

    std::mutex m_dirMutex;
    bool m_dirReady = false;

    std::mutex m_mutex; // guards m_inFlight and final-name transitions in the cache directory
    std::map<std::filesystem::path, Flight> m_inFlight;
    std::atomic<unsigned long> m_tempCounter{0};
};

} // namespace omnisplit::application
