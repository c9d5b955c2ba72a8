/**
 * @file AsyncTaskManager.hpp
 * @brief Bounded worker pool for background extraction work.
 */

#pragma once

#include <string>
#include <vector>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <algorithm>
#include <thread>
#include <type_traits>
#include <stdexcept>

namespace omnisplit::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    Extraction,
    CacheCleanup,
    Scan
};

/**
 * @struct TaskStatus
 * @brief Information about a queued, running or completed task.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<bool> isRunning{false};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage; // written once, before isCompleted is set
};

/**
 * @class AsyncTaskManager
 * @brief Runs submitted tasks on a fixed number of worker threads.
 *
 * Tasks beyond the worker count wait in a FIFO queue. The destructor drains
 * the queue and joins the workers.
 */
class AsyncTaskManager {
public:
    explicit AsyncTaskManager(size_t workerCount = 2) {
        if (workerCount == 0) workerCount = 1;
        for (size_t i = 0; i < workerCount; ++i) {
            m_workers.emplace_back(&AsyncTaskManager::WorkerLoop, this);
        }
    }

    ~AsyncTaskManager() {
        Shutdown();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /**
     * @brief Queues @p f, called with the task's status.
     * @return Future carrying f's result or its exception.
     * @throws std::runtime_error after Shutdown().
     */
    template<typename F>
    auto SubmitTask(TaskType type, const std::string& description, F&& f)
        -> std::future<std::invoke_result_t<std::decay_t<F>, std::shared_ptr<TaskStatus>>> {
        using Result = std::invoke_result_t<std::decay_t<F>, std::shared_ptr<TaskStatus>>;

        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        auto task = std::make_shared<std::packaged_task<Result()>>(
            [status, userFunc = std::forward<F>(f)]() mutable -> Result {
                status->isRunning = true;
                try {
                    if constexpr (std::is_void_v<Result>) {
                        userFunc(status);
                        status->isCompleted = true;
                    } else {
                        Result result = userFunc(status);
                        status->isCompleted = true;
                        return result;
                    }
                } catch (const std::exception& e) {
                    status->errorMessage = e.what();
                    status->failed = true;
                    status->isCompleted = true;
                    throw;
                } catch (...) {
                    status->errorMessage = "Unknown error during task execution.";
                    status->failed = true;
                    status->isCompleted = true;
                    throw;
                }
            });
        std::future<Result> future = task->get_future();

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            if (m_stopping) {
                throw std::runtime_error("AsyncTaskManager is shut down");
            }
            m_activeTasks.push_back(status);
            m_queue.emplace_back([task]() { (*task)(); });
        }
        m_cv.notify_one();
        return future;
    }

    /** @brief Snapshots of tasks not yet completed. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    size_t WorkerCount() const { return m_workers.size(); }

    /** @brief Runs what is already queued, then joins the workers. Idempotent. */
    void Shutdown() {
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            if (m_stopping && m_workers.empty()) return;
            m_stopping = true;
        }
        m_cv.notify_all();
        for (auto& worker : m_workers) {
            if (worker.joinable()) worker.join();
        }
        m_workers.clear();
    }

private:
    void WorkerLoop() {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(m_tasksMutex);
                m_cv.wait(lock, [this] { return !m_queue.empty() || m_stopping; });
                if (m_queue.empty()) return; // stopping and drained
                job = std::move(m_queue.front());
                m_queue.pop_front();
            }

            job(); // packaged_task stores exceptions in the future
            CleanupCompletedTasks();
        }
    }

    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::deque<std::function<void()>> m_queue;
    std::vector<std::thread> m_workers;
    std::mutex m_tasksMutex;
    std::condition_variable m_cv;
    bool m_stopping = false;
};

} // namespace omnisplit::application
