#include <QtTest/QtTest>
#include "core/search/task_pool.h"

#include <atomic>
#include <chrono>
#include <stdexcept>

class TestTaskPool : public QObject {
    Q_OBJECT

private slots:
    void testWorkerCountIsAtLeastOne()
    {
        rb::TaskPool zero(0);
        QCOMPARE(zero.workerCount(), 1);
        rb::TaskPool four(4, QStringLiteral("four"));
        QCOMPARE(four.workerCount(), 4);
    }

    void testSingleWorkerRunsInSubmissionOrder()
    {
        std::mutex mutex;
        std::vector<int> order;
        {
            rb::TaskPool pool(1, QStringLiteral("serial"));
            for (int i = 0; i < 20; ++i) {
                QVERIFY(pool.submit([i, &mutex, &order] {
                    std::lock_guard<std::mutex> lock(mutex);
                    order.push_back(i);
                }));
            }
        }

        QCOMPARE(static_cast<int>(order.size()), 20);
        for (int i = 0; i < 20; ++i) {
            QCOMPARE(order[static_cast<size_t>(i)], i);
        }
    }

    void testWorkersRunConcurrently()
    {
        rb::TaskPool pool(3);
        std::atomic<int> running{0};
        std::atomic<int> peak{0};

        for (int i = 0; i < 3; ++i) {
            pool.submit([&running, &peak] {
                const int now = ++running;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                --running;
            });
        }
        pool.shutdown();
        QCOMPARE(peak.load(), 3);
    }

    void testShutdownDrainsQueueAndRejectsNewWork()
    {
        std::atomic<int> done{0};
        rb::TaskPool pool(1);
        for (int i = 0; i < 5; ++i) {
            pool.submit([&done] {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                ++done;
            });
        }

        pool.shutdown();
        QCOMPARE(done.load(), 5);
        QCOMPARE(pool.pendingCount(), size_t(0));
        QVERIFY(!pool.submit([&done] { ++done; }));
        pool.shutdown();
        QCOMPARE(done.load(), 5);
    }

    void testThrowingTaskKeepsWorkerAlive()
    {
        std::atomic<int> done{0};
        {
            rb::TaskPool pool(1);
            pool.submit([] { throw std::runtime_error("boom"); });
            pool.submit([] { throw 42; });
            pool.submit([&done] { ++done; });
        }
        QCOMPARE(done.load(), 1);
    }
};

QTEST_MAIN(TestTaskPool)
#include "test_task_pool.moc"
