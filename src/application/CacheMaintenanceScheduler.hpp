/**
 * @file CacheMaintenanceScheduler.hpp
 * @brief Background thread running periodic cache cleanup.
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace omnisplit::application {

class SubdocumentExtractionService;

/**
 * @class CacheMaintenanceScheduler
 * @brief Calls cleanupCache(maxAgeHours) every interval until stopped.
 */
class CacheMaintenanceScheduler {
public:
    CacheMaintenanceScheduler(std::shared_ptr<SubdocumentExtractionService> service,
                              double maxAgeHours,
                              std::chrono::milliseconds interval);
    ~CacheMaintenanceScheduler();

    CacheMaintenanceScheduler(const CacheMaintenanceScheduler&) = delete;
    CacheMaintenanceScheduler& operator=(const CacheMaintenanceScheduler&) = delete;

    /** @brief Starts the worker. No-op if already running or the interval is 0. */
    void start();

    /** @brief Stops and joins the worker. Idempotent. */
    void stop();

    /** @brief One cleanup pass on the calling thread. @return Files removed. */
    size_t runOnce();

    bool isRunning() const;

private:
    void workerLoop();

    std::shared_ptr<SubdocumentExtractionService> m_service;
    double m_maxAgeHours;
    std::chrono::milliseconds m_interval;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_worker;
    bool m_running = false;
};

} // namespace omnisplit::application
