#include "core/search/task_pool.h"
#include "core/shared/logging.h"

#include <exception>

namespace rb {

TaskPool::TaskPool(int workerCount, QString name)
    : m_name(std::move(name))
{
    const int count = workerCount < 1 ? 1 : workerCount;
    m_workers.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        m_workers.emplace_back([this, i] { workerLoop(i); });
    }
    LOG_DEBUG(rbSearch, "TaskPool '%s' started with %d workers", qUtf8Printable(m_name), count);
}

TaskPool::~TaskPool()
{
    shutdown();
}

bool TaskPool::submit(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping.load()) {
            return false;
        }
        m_queue.push_back(std::move(task));
    }
    m_cv.notify_one();
    return true;
}

void TaskPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping.store(true);
    }
    m_cv.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t TaskPool::pendingCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

void TaskPool::workerLoop(int workerIndex)
{
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return m_stopping.load() || !m_queue.empty();
            });

            if (m_queue.empty()) {
                break;  // stopping and drained
            }
            task = std::move(m_queue.front());
            m_queue.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_WARN(rbSearch, "TaskPool '%s' worker %d: task threw: %s",
                     qUtf8Printable(m_name), workerIndex, e.what());
        } catch (...) {
            LOG_WARN(rbSearch, "TaskPool '%s' worker %d: task threw an unknown exception",
                     qUtf8Printable(m_name), workerIndex);
        }
    }

    LOG_DEBUG(rbSearch, "TaskPool '%s' worker %d stopped", qUtf8Printable(m_name), workerIndex);
}

} // namespace rb
