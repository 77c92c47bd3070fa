#pragma once

#include <QString>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace rb {

// TaskPool: fixed set of worker threads draining a FIFO of tasks.
//
// A pool with one worker executes tasks serially in submission order. The
// destructor stops accepting work, lets workers finish what is queued and
// joins them.
class TaskPool {
public:
    explicit TaskPool(int workerCount, QString name = QStringLiteral("pool"));
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;
    TaskPool(TaskPool&&) = delete;
    TaskPool& operator=(TaskPool&&) = delete;

    // Returns false once shutdown has begun; the task is then not run.
    bool submit(std::function<void()> task);

    // Drains the queue and joins every worker. Idempotent.
    void shutdown();

    int workerCount() const { return static_cast<int>(m_workers.size()); }
    size_t pendingCount() const;

private:
    void workerLoop(int workerIndex);

    QString m_name;
    std::vector<std::thread> m_workers;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::function<void()>> m_queue;
    std::atomic<bool> m_stopping{false};
};

} // namespace rb
