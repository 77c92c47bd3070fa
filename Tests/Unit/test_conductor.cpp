#include <QtTest/QtTest>
#include "core/history/command_history.h"
#include "core/search/conductor.h"
#include "search_test_fakes.h"

#include <QElapsedTimer>
#include <QSemaphore>
#include <QSignalSpy>

using rb::test::FakeProvider;

namespace {

rb::ProviderResult installedResult(const QString& name, int score)
{
    rb::InstalledProgram program;
    program.name = name;
    program.path = QStringLiteral("/apps/") + name.toLower() + QStringLiteral(".desktop");
    return {rb::SearchSource::InstalledPrograms, rb::SearchResult(std::move(program)), score};
}

rb::ProviderResult historyResult(const QString& command, int score,
                                 const std::optional<QString>& display = std::nullopt)
{
    rb::HistoryCommand row;
    row.command = command;
    row.display = display;
    return {rb::SearchSource::CommandHistory, rb::SearchResult(std::move(row)), score};
}

struct Delivery {
    quint64 generation = 0;
    QStringList names;
    std::vector<rb::SearchResult> results;
};

} // namespace

class TestConductor : public QObject {
    Q_OBJECT

private slots:
    void testMergesProvidersIntoOneRankedList();
    void testEmptyQueryDeliversRecents();
    void testStaleGenerationIsNeverDelivered();
    void testSlowProviderIsCutOffByTimeout();
    void testFailingProviderDoesNotBlockOthers();
    void testScoreObserverSeesFinalScores();
    void testDestroyedContextReceivesNothing();
    void testContextDestroyedDuringAggregationReceivesNothing();

private:
    static rb::Conductor::ResultsCallback collect(std::vector<Delivery>& sink)
    {
        return [&sink](quint64 generation, const std::vector<rb::SearchResult>& results) {
            Delivery d;
            d.generation = generation;
            d.results = results;
            for (const rb::SearchResult& r : results) {
                d.names.append(r.displayName());
            }
            sink.push_back(std::move(d));
        };
    }
};

void TestConductor::testMergesProvidersIntoOneRankedList()
{
    auto programs = std::make_shared<FakeProvider>(rb::SearchSource::InstalledPrograms,
        std::vector<rb::ProviderResult>{installedResult(QStringLiteral("Codex"), 900),
                                        installedResult(QStringLiteral("Code"), 1000)});
    auto history = std::make_shared<FakeProvider>(rb::SearchSource::CommandHistory,
        std::vector<rb::ProviderResult>{historyResult(QStringLiteral("code ."), 540)});

    rb::Conductor conductor({programs, history}, nullptr, nullptr);
    QSignalSpy spy(&conductor, &rb::Conductor::searchDelivered);

    std::vector<Delivery> deliveries;
    const quint64 generation = conductor.search(QStringLiteral("code"), collect(deliveries));

    QVERIFY(spy.wait(5000));
    QCOMPARE(static_cast<int>(deliveries.size()), 1);
    QCOMPARE(deliveries[0].generation, generation);
    QCOMPARE(deliveries[0].names, QStringList({QStringLiteral("Code"), QStringLiteral("Codex"),
                                               QStringLiteral("code .")}));
    QCOMPARE(spy.at(0).at(1).toInt(), 3);
    QCOMPARE(programs->calls.load(), 1);
    QCOMPARE(history->calls.load(), 1);
}

void TestConductor::testEmptyQueryDeliversRecents()
{
    auto store = std::make_shared<rb::CommandHistory>();
    for (const char* command : {"one", "two", "three"}) {
        store->record(QString::fromLatin1(command));
    }

    auto provider = std::make_shared<FakeProvider>(rb::SearchSource::InstalledPrograms);
    rb::ConductorConfig config;
    config.recentLimit = 2;
    rb::Conductor conductor({provider}, store, nullptr, config);

    int observedGenerations = 0;
    int observedScores = -1;
    conductor.setScoreObserver([&](quint64, const QHash<QString, int>& scores) {
        ++observedGenerations;
        observedScores = scores.size();
    });

    QSignalSpy spy(&conductor, &rb::Conductor::searchDelivered);
    std::vector<Delivery> deliveries;
    conductor.search(QStringLiteral("   "), collect(deliveries));

    QVERIFY(spy.wait(5000));
    QCOMPARE(deliveries[0].names, QStringList({QStringLiteral("three"), QStringLiteral("two")}));
    for (const rb::SearchResult& r : deliveries[0].results) {
        QVERIFY(r.as<rb::HistoryCommand>()->isRecent);
    }
    QCOMPARE(provider->calls.load(), 0);
    QCOMPARE(observedGenerations, 1);
    QCOMPARE(observedScores, 0);
}

void TestConductor::testStaleGenerationIsNeverDelivered()
{
    auto slow = std::make_shared<FakeProvider>(rb::SearchSource::InstalledPrograms,
        std::vector<rb::ProviderResult>{installedResult(QStringLiteral("Alpha"), 900)});
    slow->delayMs = 200;

    rb::Conductor conductor({slow}, nullptr, nullptr);
    QSignalSpy spy(&conductor, &rb::Conductor::searchDelivered);

    std::vector<Delivery> deliveries;
    const quint64 first = conductor.search(QStringLiteral("a"), collect(deliveries));
    const quint64 second = conductor.search(QStringLiteral("al"), collect(deliveries));
    QVERIFY(second > first);
    QCOMPARE(conductor.currentGeneration(), second);

    QVERIFY(spy.wait(5000));
    QTest::qWait(300);

    QCOMPARE(static_cast<int>(deliveries.size()), 1);
    QCOMPARE(deliveries[0].generation, second);
    QCOMPARE(spy.count(), 1);
}

void TestConductor::testSlowProviderIsCutOffByTimeout()
{
    auto fast = std::make_shared<FakeProvider>(rb::SearchSource::InstalledPrograms,
        std::vector<rb::ProviderResult>{installedResult(QStringLiteral("Fast"), 900)});
    auto slow = std::make_shared<FakeProvider>(rb::SearchSource::Catalog,
        std::vector<rb::ProviderResult>{installedResult(QStringLiteral("Slow"), 1000)});
    slow->delayMs = 800;

    rb::ConductorConfig config;
    config.providerTimeoutMs = 100;
    rb::Conductor conductor({fast, slow}, nullptr, nullptr, config);
    QSignalSpy spy(&conductor, &rb::Conductor::searchDelivered);

    std::vector<Delivery> deliveries;
    QElapsedTimer timer;
    timer.start();
    conductor.search(QStringLiteral("f"), collect(deliveries));

    QVERIFY(spy.wait(5000));
    QVERIFY(timer.elapsed() < 700);
    QCOMPARE(deliveries[0].names, QStringList({QStringLiteral("Fast")}));
}

void TestConductor::testFailingProviderDoesNotBlockOthers()
{
    auto good = std::make_shared<FakeProvider>(rb::SearchSource::InstalledPrograms,
        std::vector<rb::ProviderResult>{installedResult(QStringLiteral("Good"), 900)});
    auto bad = std::make_shared<FakeProvider>(rb::SearchSource::Catalog);
    bad->throwOnSearch = true;
    auto odd = std::make_shared<FakeProvider>(rb::SearchSource::CommandHistory);
    odd->throwUnknownOnSearch = true;

    // No timeout: the join only completes if every failed provider still
    // reports back.
    rb::ConductorConfig config;
    config.providerTimeoutMs = 0;
    rb::Conductor conductor({good, bad, odd}, nullptr, nullptr, config);
    QSignalSpy spy(&conductor, &rb::Conductor::searchDelivered);

    std::vector<Delivery> deliveries;
    conductor.search(QStringLiteral("g"), collect(deliveries));

    QVERIFY(spy.wait(5000));
    QCOMPARE(deliveries[0].names, QStringList({QStringLiteral("Good")}));
    QCOMPARE(bad->calls.load(), 1);
    QCOMPARE(odd->calls.load(), 1);
}

void TestConductor::testScoreObserverSeesFinalScores()
{
    auto programs = std::make_shared<FakeProvider>(rb::SearchSource::InstalledPrograms,
        std::vector<rb::ProviderResult>{installedResult(QStringLiteral("Firefox"), 900)});
    auto history = std::make_shared<FakeProvider>(rb::SearchSource::CommandHistory,
        std::vector<rb::ProviderResult>{historyResult(QStringLiteral("firefox"), 540,
                                                      QStringLiteral("Firefox"))});

    rb::Conductor conductor({programs, history}, nullptr, nullptr);

    std::mutex mutex;
    QHash<QString, int> observed;
    quint64 observedGeneration = 0;
    conductor.setScoreObserver([&](quint64 generation, const QHash<QString, int>& scores) {
        std::lock_guard<std::mutex> lock(mutex);
        observedGeneration = generation;
        observed = scores;
    });

    QSignalSpy spy(&conductor, &rb::Conductor::searchDelivered);
    std::vector<Delivery> deliveries;
    const quint64 generation = conductor.search(QStringLiteral("fire"), collect(deliveries));
    QVERIFY(spy.wait(5000));

    std::lock_guard<std::mutex> lock(mutex);
    QCOMPARE(observedGeneration, generation);
    QCOMPARE(observed.size(), 1);
    QCOMPARE(observed.value(QStringLiteral("/apps/firefox.desktop")), 1440);
}

void TestConductor::testDestroyedContextReceivesNothing()
{
    auto provider = std::make_shared<FakeProvider>(rb::SearchSource::InstalledPrograms,
        std::vector<rb::ProviderResult>{installedResult(QStringLiteral("Late"), 900)});
    provider->delayMs = 100;

    rb::Conductor conductor({provider}, nullptr, nullptr);
    QSignalSpy spy(&conductor, &rb::Conductor::searchDelivered);

    auto* context = new QObject;
    std::vector<Delivery> deliveries;
    conductor.search(QStringLiteral("late"), collect(deliveries), context);
    delete context;

    QVERIFY(!spy.wait(500));
    QVERIFY(deliveries.empty());
}

void TestConductor::testContextDestroyedDuringAggregationReceivesNothing()
{
    auto provider = std::make_shared<FakeProvider>(rb::SearchSource::InstalledPrograms,
        std::vector<rb::ProviderResult>{installedResult(QStringLiteral("Late"), 900)});

    rb::Conductor conductor({provider}, nullptr, nullptr);
    QSignalSpy spy(&conductor, &rb::Conductor::searchDelivered);

    // The observer runs on the aggregation worker right before the list is
    // handed off; hold it there until the context is gone.
    QSemaphore observerEntered;
    QSemaphore contextDeleted;
    conductor.setScoreObserver([&](quint64, const QHash<QString, int>&) {
        observerEntered.release();
        contextDeleted.acquire();
    });

    auto* context = new QObject;
    std::vector<Delivery> deliveries;
    conductor.search(QStringLiteral("late"), collect(deliveries), context);

    QVERIFY(observerEntered.tryAcquire(1, 5000));
    delete context;
    contextDeleted.release();

    QVERIFY(!spy.wait(500));
    QVERIFY(deliveries.empty());

    // The conductor itself keeps delivering to live contexts.
    QObject liveContext;
    conductor.setScoreObserver(nullptr);
    conductor.search(QStringLiteral("late"), collect(deliveries), &liveContext);
    QVERIFY(spy.wait(5000));
    QCOMPARE(static_cast<int>(deliveries.size()), 1);
    QCOMPARE(deliveries[0].names, QStringList({QStringLiteral("Late")}));
}

QTEST_MAIN(TestConductor)
#include "test_conductor.moc"
