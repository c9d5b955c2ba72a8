/**
 * @file CacheMaintenanceScheduler.cpp
 * @brief Implementation of CacheMaintenanceScheduler.
 */

#include "application/CacheMaintenanceScheduler.hpp"
#include <iostream>
#include "application/SubdocumentExtractionService.hpp"

namespace omnisplit::application {

CacheMaintenanceScheduler::CacheMaintenanceScheduler(std::shared_ptr<SubdocumentExtractionService> service,
                                                     double maxAgeHours,
                                                     std::chrono::milliseconds interval)
    : m_service(std::move(service)), m_maxAgeHours(maxAgeHours), m_interval(interval) {}

CacheMaintenanceScheduler::~CacheMaintenanceScheduler() {
    stop();
}

void CacheMaintenanceScheduler::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running || m_interval.count() <= 0) return;
    m_running = true;
    m_worker = std::thread(&CacheMaintenanceScheduler::workerLoop, this);
}

void CacheMaintenanceScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

bool CacheMaintenanceScheduler::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

size_t CacheMaintenanceScheduler::runOnce() {
    return m_service->cleanupCache(m_maxAgeHours);
}

void CacheMaintenanceScheduler::workerLoop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_cv.wait_for(lock, m_interval, [this] { return !m_running; })) {
                return; // Exit point
            }
        }

        // Process outside lock
        try {
            runOnce();
        } catch (const std::exception& e) {
            std::cerr << "[CacheMaintenanceScheduler] Cleanup failed: " << e.what() << std::endl;
        }
    }
}

} // namespace omnisplit::application
