/**
 * @file SubdocumentExtractionService.cpp
 * @brief Implementation of SubdocumentExtractionService.
 */

#include "application/SubdocumentExtractionService.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include "domain/ContentErrors.hpp"
#include "infrastructure/PathUtils.hpp"

namespace omnisplit::application {

namespace fs = std::filesystem;
using domain::ContentNotFoundError;
using domain::ContentResource;
using domain::ExtractionFailedError;
using domain::ExtractionTimeoutError;
using domain::Work;
using infrastructure::PathUtils;

namespace {
    constexpr const char* kTempMarker = ".part-";
    constexpr const char* kCacheExtension = ".epub";

    bool IsTempFile(const fs::path& file) {
        return file.filename().string().find(kTempMarker) != std::string::npos;
    }
}

SubdocumentExtractionService::SubdocumentExtractionService(std::shared_ptr<domain::VirtualBookRepository> repository,
                                                           std::shared_ptr<domain::ArchiveSlicer> slicer,
                                                           std::shared_ptr<AsyncTaskManager> taskManager,
                                                           ExtractionServiceOptions options)
    : m_repository(std::move(repository)),
      m_slicer(std::move(slicer)),
      m_taskManager(std::move(taskManager)),
      m_options(std::move(options)) {
    if (m_options.cacheDirectory.empty()) {
        throw std::invalid_argument("SubdocumentExtractionService: cache directory must be set");
    }
}

SubdocumentExtractionService::~SubdocumentExtractionService() {
    // Queued extractions capture this; let them finish before members go away.
    std::vector<std::shared_future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [path, flight] : m_inFlight) pending.push_back(flight.done);
    }
    for (auto& done : pending) done.wait();
    // Workers publish while holding m_mutex; wait for the last one to let go.
    std::lock_guard<std::mutex> lock(m_mutex);
}

fs::path SubdocumentExtractionService::cacheDirectory() {
    std::lock_guard<std::mutex> lock(m_dirMutex);
    const fs::path& dir = m_options.cacheDirectory;
    if (m_dirReady && fs::exists(dir)) return dir;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw ExtractionFailedError("Cannot create cache directory " + dir.string() + ": " + ec.message());
    }
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::add, ec);
    if (ec) {
        std::cerr << "[SubdocumentExtractionService] Cannot set permissions on " << dir << ": " << ec.message() << std::endl;
    }
    m_dirReady = true;
    return dir;
}

std::string SubdocumentExtractionService::cacheFileName(const fs::path& omnibusPath, const std::string& virtualBookId) {
    std::string stem = omnibusPath.stem().string();
    if (stem.empty()) stem = "omnibus";
    // Percent-encoding escapes '%' too, so distinct ids never share a file.
    return stem + "-" + PathUtils::PercentEncode(virtualBookId, false) + kCacheExtension;
}

Work SubdocumentExtractionService::ToWork(const domain::VirtualBook& book) {
    Work work;
    work.title = book.title;

    if (auto fragment = PathUtils::UrlFragment(book.url)) {
        work.href = *fragment;
    } else {
        std::string url = book.url;
        size_t hash = url.find('#');
        if (hash != std::string::npos) url.erase(hash);
        size_t slash = url.find_last_of('/');
        work.href = slash == std::string::npos ? url : url.substr(slash + 1);
    }

    work.position = std::max(1, static_cast<int>(std::lround(book.number)));
    work.type = domain::WorkType::GenericEntry;

    const domain::BookMetadata& m = book.metadata;
    work.metadata["title"] = m.title.empty() ? book.title : m.title;
    if (!m.summary.empty()) work.metadata["description"] = m.summary;
    if (!m.language.empty()) work.metadata["language"] = m.language;
    if (!m.publisher.empty()) work.metadata["publisher"] = m.publisher;
    for (size_t i = 0; i < m.authors.size(); ++i) {
        work.metadata["author" + std::to_string(i)] = m.authors[i];
    }
    return work;
}

fs::path SubdocumentExtractionService::resolveContainer(const domain::VirtualBookWithOmnibus& resolved) const {
    auto path = PathUtils::FileUrlToPath(resolved.omnibus.url);
    if (!path) {
        throw ContentNotFoundError("Malformed container location for omnibus " + resolved.omnibus.id + ": " +
                                   resolved.omnibus.url);
    }
    std::error_code ec;
    if (!fs::is_regular_file(*path, ec)) {
        throw ContentNotFoundError("Container of omnibus " + resolved.omnibus.id + " not found: " + path->string());
    }
    return *path;
}

bool SubdocumentExtractionService::isFreshLocked(const fs::path& cached, const fs::path& source) const {
    std::error_code ec;
    if (!fs::exists(cached, ec)) return false;
    if (!m_options.revalidateAgainstSource) return true;

    auto cachedTime = fs::last_write_time(cached, ec);
    if (ec) return true;
    auto sourceTime = fs::last_write_time(source, ec);
    if (ec) return true;
    if (cachedTime < sourceTime) {
        std::cout << "[SubdocumentExtractionService] Cached " << cached.filename() << " is older than its container, regenerating" << std::endl;
        return false;
    }
    return true;
}

bool SubdocumentExtractionService::isProtectedLocked(const fs::path& file) const {
    return IsTempFile(file) || m_inFlight.count(file) > 0;
}

ContentResource SubdocumentExtractionService::getContent(const std::string& virtualBookId) {
    return getContent(virtualBookId, m_options.defaultTimeout);
}

ContentResource SubdocumentExtractionService::getContent(const std::string& virtualBookId,
                                                         std::chrono::milliseconds timeout) {
    auto resolved = m_repository->resolveVirtualBook(virtualBookId);
    if (!resolved) {
        throw ContentNotFoundError("Unknown virtual book or omnibus: " + virtualBookId);
    }
    const fs::path source = resolveContainer(*resolved);
    const Work work = ToWork(resolved->virtualBook);
    const fs::path finalPath = cacheDirectory() / cacheFileName(source, virtualBookId);

    std::shared_future<void> done;
    domain::CancellationToken cancel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_inFlight.find(finalPath);
        if (it != m_inFlight.end()) {
            done = it->second.done;
            cancel = it->second.cancel;
            ++it->second.waiters;
        } else if (isFreshLocked(finalPath, source)) {
            return ContentResource(finalPath);
        } else {
            auto promise = std::make_shared<std::promise<void>>();
            done = promise->get_future().share();
            m_inFlight.emplace(finalPath, Flight{done, cancel, 1});

            try {
                m_taskManager->SubmitTask(TaskType::Extraction, "Extract " + virtualBookId,
                    [this, work, source, finalPath, cancel, promise](std::shared_ptr<TaskStatus>) {
                        runExtraction(work, source, finalPath, cancel, promise);
                    });
            } catch (const std::exception& e) {
                m_inFlight.erase(finalPath);
                throw ExtractionFailedError("Cannot schedule extraction of " + virtualBookId + ": " + e.what());
            }
        }
    }

    if (timeout.count() > 0 && done.wait_for(timeout) == std::future_status::timeout) {
        std::lock_guard<std::mutex> lock(m_mutex);
        // The worker publishes and erases the flight under this lock, so "not ready"
        // here means the flight is still registered.
        if (done.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            auto it = m_inFlight.find(finalPath);
            if (it != m_inFlight.end() && --it->second.waiters == 0) {
                // Nobody is left to read the result.
                cancel.cancel();
            }
            throw ExtractionTimeoutError("Extraction of " + virtualBookId + " timed out after " +
                                         std::to_string(timeout.count()) + " ms");
        }
    }

    done.get();
    return ContentResource(finalPath);
}

void SubdocumentExtractionService::runExtraction(const Work& work,
                                                 const fs::path& source,
                                                 const fs::path& finalPath,
                                                 const domain::CancellationToken& cancel,
                                                 const std::shared_ptr<std::promise<void>>& promise) {
    fs::path tempPath = finalPath;
    tempPath += kTempMarker + std::to_string(m_tempCounter++);

    std::exception_ptr failure;
    try {
        cancel.throwIfCancelled(work.title);
        m_slicer->extract(work, source, tempPath, cancel);
    } catch (const domain::ExtractionCancelledError&) {
        failure = std::make_exception_ptr(ExtractionTimeoutError("Extraction of '" + work.title + "' timed out"));
    } catch (const std::exception& e) {
        failure = std::make_exception_ptr(ExtractionFailedError("Extraction of '" + work.title + "' failed: " + e.what()));
    } catch (...) {
        failure = std::make_exception_ptr(ExtractionFailedError("Extraction of '" + work.title + "' failed: unknown error"));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    if (!failure && cancel.isCancelled()) {
        failure = std::make_exception_ptr(ExtractionTimeoutError("Extraction of '" + work.title + "' timed out"));
    }
    if (!failure && !fs::exists(tempPath, ec)) {
        failure = std::make_exception_ptr(ExtractionFailedError("Extraction of '" + work.title + "' produced no output"));
    }
    if (!failure) {
        fs::rename(tempPath, finalPath, ec);
        if (ec) {
            failure = std::make_exception_ptr(ExtractionFailedError("Cannot publish " + finalPath.string() + ": " + ec.message()));
        }
    }

    if (failure) {
        std::error_code removeError;
        fs::remove(tempPath, removeError);
        std::cerr << "[SubdocumentExtractionService] Extraction failed for " << finalPath.filename() << std::endl;
    } else {
        std::cout << "[SubdocumentExtractionService] Extracted " << finalPath.filename() << std::endl;
    }

    m_inFlight.erase(finalPath);
    if (failure) {
        promise->set_exception(failure);
    } else {
        promise->set_value();
    }
}

std::future<ContentResource> SubdocumentExtractionService::getContentAsync(const std::string& virtualBookId) {
    return std::async(std::launch::async, [this, virtualBookId]() { return getContent(virtualBookId); });
}

bool SubdocumentExtractionService::contentExists(const std::string& virtualBookId) {
    try {
        auto resolved = m_repository->resolveVirtualBook(virtualBookId);
        if (!resolved) return false;
        resolveContainer(*resolved);
        return true;
    } catch (const ContentNotFoundError&) {
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[SubdocumentExtractionService] contentExists(" << virtualBookId << "): " << e.what() << std::endl;
        return false;
    }
}

size_t SubdocumentExtractionService::cleanupCache(double maxAgeHours) {
    return cleanupCache(maxAgeHours, fs::file_time_type::clock::now());
}

size_t SubdocumentExtractionService::cleanupCache(double maxAgeHours, fs::file_time_type now) {
    const fs::path& dir = m_options.cacheDirectory;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return 0;

    const double limit = (std::isnan(maxAgeHours) || maxAgeHours < 0.0) ? 0.0 : maxAgeHours;
    size_t removed = 0;

    std::lock_guard<std::mutex> lock(m_mutex);
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path file = it->path();
        std::error_code fileError;
        if (!it->is_regular_file(fileError) || isProtectedLocked(file)) continue;

        auto modified = fs::last_write_time(file, fileError);
        if (fileError) {
            std::cerr << "[SubdocumentExtractionService] Cannot stat " << file << ": " << fileError.message() << std::endl;
            continue;
        }
        double ageHours = std::chrono::duration<double, std::ratio<3600>>(now - modified).count();
        if (limit > 0.0 && ageHours < limit) continue;

        if (fs::remove(file, fileError)) {
            ++removed;
        } else if (fileError) {
            std::cerr << "[SubdocumentExtractionService] Failed to delete " << file << ": " << fileError.message() << std::endl;
        }
    }
    if (ec) {
        std::cerr << "[SubdocumentExtractionService] Cache listing aborted: " << ec.message() << std::endl;
    }
    if (removed > 0) {
        std::cout << "[SubdocumentExtractionService] Cleanup removed " << removed << " cached file(s)" << std::endl;
    }
    return removed;
}

size_t SubdocumentExtractionService::evictOmnibus(const domain::Omnibus& omnibus) {
    auto path = PathUtils::FileUrlToPath(omnibus.url);
    if (!path) {
        std::cerr << "[SubdocumentExtractionService] Cannot evict omnibus " << omnibus.id << ": malformed location" << std::endl;
        return 0;
    }

    const fs::path dir = m_options.cacheDirectory;
    size_t removed = 0;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& book : m_repository->findByOmnibusId(omnibus.id)) {
        fs::path file = dir / cacheFileName(*path, book.id);
        if (isProtectedLocked(file)) continue;
        std::error_code ec;
        if (fs::remove(file, ec)) {
            ++removed;
        } else if (ec) {
            std::cerr << "[SubdocumentExtractionService] Failed to delete " << file << ": " << ec.message() << std::endl;
        }
    }
    return removed;
}

} // namespace omnisplit::application
