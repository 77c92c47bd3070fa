#pragma once

#include "core/providers/search_provider.h"

#include <QHash>
#include <QObject>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace rb {

class CommandHistory;
class TargetResolver;
class TaskPool;

struct ConductorConfig {
    int recentLimit = 8;
    int providerWorkers = 3;
    int providerTimeoutMs = 2000;  // 0 waits for every provider
};

// Conductor: runs every provider for a query and delivers one ranked list.
//
// Each search() takes a new generation number. Providers run in parallel on
// the provider pool; a serial aggregation worker joins them, reranks and
// hands the list to the caller's context through a queued connection, so a
// context destroyed mid-search simply receives nothing. The list is dropped
// if a newer search started in the meantime; the check is repeated on the
// delivery thread right before the callback runs, so a callback only ever
// sees results for the latest query.
//
// An empty query runs no provider and delivers the most recent history
// entries instead.
class Conductor : public QObject {
    Q_OBJECT

public:
    using ResultsCallback = std::function<void(quint64 generation,
                                               const std::vector<SearchResult>& results)>;
    using ScoreObserver = std::function<void(quint64 generation,
                                             const QHash<QString, int>& scoresByIdentity)>;

    Conductor(std::vector<std::shared_ptr<SearchProvider>> providers,
              std::shared_ptr<const CommandHistory> history,
              std::shared_ptr<const TargetResolver> resolver,
              ConductorConfig config = {},
              QObject* parent = nullptr);
    ~Conductor() override;

    // Starts a search and returns its generation. callback runs on context's
    // thread (this conductor's when context is null) and never for a stale
    // generation.
    quint64 search(const QString& raw, ResultsCallback callback, QObject* context = nullptr);

    quint64 currentGeneration() const;

    // Receives the final score of every delivered result, keyed by identity.
    // Called from the aggregation worker.
    void setScoreObserver(ScoreObserver observer);

signals:
    // Emitted on the delivery context's thread after a callback ran.
    void searchDelivered(quint64 generation, int resultCount);

    // Emitted from the worker once a generation's list is ready. Internal:
    // search() connects each callback to it.
    void resultsReady(quint64 generation);

private:
    struct FanOut;
    struct Delivery;

    quint64 nextGeneration();
    std::shared_ptr<Delivery> connectDelivery(quint64 generation, ResultsCallback callback,
                                              QObject* context);
    void deliverRecents(quint64 generation, const std::shared_ptr<Delivery>& delivery);
    void aggregate(quint64 generation, const SearchQuery& query,
                   const std::shared_ptr<FanOut>& fanOut,
                   const std::shared_ptr<Delivery>& delivery);
    void post(quint64 generation, std::vector<SearchResult> results,
              const std::shared_ptr<Delivery>& delivery);
    void notifyObserver(quint64 generation, const QHash<QString, int>& scores);

    std::vector<std::shared_ptr<SearchProvider>> m_providers;
    std::shared_ptr<const CommandHistory> m_history;
    std::shared_ptr<const TargetResolver> m_resolver;
    ConductorConfig m_config;

    std::shared_ptr<std::atomic<quint64>> m_generation;
    QMetaObject::Connection m_pendingDelivery;  // only touched by search()'s thread

    std::mutex m_observerMutex;
    ScoreObserver m_scoreObserver;

    std::unique_ptr<TaskPool> m_providerPool;
    std::unique_ptr<TaskPool> m_aggregationPool;
};

} // namespace rb
