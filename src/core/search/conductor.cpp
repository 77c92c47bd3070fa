#include "core/search/conductor.h"
#include "core/history/command_history.h"
#include "core/search/result_reranker.h"
#include "core/search/target_resolver.h"
#include "core/search/task_pool.h"
#include "core/shared/logging.h"

#include <QMetaObject>
#include <QPointer>

#include <chrono>
#include <condition_variable>
#include <exception>

namespace rb {

// Join state shared by the provider tasks and the aggregation task of one
// generation. Once closed, late provider output is discarded.
struct Conductor::FanOut {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<ProviderResult> collected;
    size_t pending = 0;
    bool closed = false;
};

// The list of one generation, written by the worker before resultsReady is
// emitted and read by the connected callback on the context's thread.
struct Conductor::Delivery {
    std::vector<SearchResult> results;
};

Conductor::Conductor(std::vector<std::shared_ptr<SearchProvider>> providers,
                     std::shared_ptr<const CommandHistory> history,
                     std::shared_ptr<const TargetResolver> resolver,
                     ConductorConfig config,
                     QObject* parent)
    : QObject(parent)
    , m_providers(std::move(providers))
    , m_history(std::move(history))
    , m_resolver(std::move(resolver))
    , m_config(config)
    , m_generation(std::make_shared<std::atomic<quint64>>(0))
    , m_providerPool(std::make_unique<TaskPool>(config.providerWorkers,
                                                QStringLiteral("providers")))
    , m_aggregationPool(std::make_unique<TaskPool>(1, QStringLiteral("aggregation")))
{
    LOG_INFO(rbSearch, "Conductor ready: %d providers, %d workers, timeout %d ms",
             static_cast<int>(m_providers.size()), m_providerPool->workerCount(),
             m_config.providerTimeoutMs);
}

Conductor::~Conductor()
{
    // Invalidate in-flight work before joining so queued tasks bail out early.
    m_generation->fetch_add(1);
    m_providerPool->shutdown();
    m_aggregationPool->shutdown();
}

quint64 Conductor::nextGeneration()
{
    return m_generation->fetch_add(1) + 1;
}

quint64 Conductor::currentGeneration() const
{
    return m_generation->load();
}

void Conductor::setScoreObserver(ScoreObserver observer)
{
    std::lock_guard<std::mutex> lock(m_observerMutex);
    m_scoreObserver = std::move(observer);
}

void Conductor::notifyObserver(quint64 generation, const QHash<QString, int>& scores)
{
    ScoreObserver observer;
    {
        std::lock_guard<std::mutex> lock(m_observerMutex);
        observer = m_scoreObserver;
    }
    if (observer) {
        observer(generation, scores);
    }
}

quint64 Conductor::search(const QString& raw, ResultsCallback callback, QObject* context)
{
    const SearchQuery query(raw);
    const quint64 generation = nextGeneration();
    const std::shared_ptr<Delivery> delivery =
        connectDelivery(generation, std::move(callback), context ? context : this);

    if (query.isEmpty()) {
        deliverRecents(generation, delivery);
        return generation;
    }

    auto fanOut = std::make_shared<FanOut>();
    fanOut->pending = m_providers.size();
    const auto generationCounter = m_generation;

    for (const auto& provider : m_providers) {
        const bool queued = m_providerPool->submit([provider, query, fanOut, generation,
                                                    generationCounter] {
            std::vector<ProviderResult> results;
            if (generationCounter->load() == generation) {
                try {
                    results = provider->search(query);
                } catch (const std::exception& e) {
                    LOG_WARN(rbSearch, "Provider %s failed: %s",
                             qUtf8Printable(searchSourceToString(provider->source())), e.what());
                } catch (...) {
                    LOG_WARN(rbSearch, "Provider %s failed: unknown exception",
                             qUtf8Printable(searchSourceToString(provider->source())));
                }
            }

            {
                std::lock_guard<std::mutex> lock(fanOut->mutex);
                if (!fanOut->closed) {
                    fanOut->collected.insert(fanOut->collected.end(),
                                             std::make_move_iterator(results.begin()),
                                             std::make_move_iterator(results.end()));
                }
                --fanOut->pending;
            }
            fanOut->cv.notify_all();
        });

        if (!queued) {
            std::lock_guard<std::mutex> lock(fanOut->mutex);
            --fanOut->pending;
        }
    }

    const bool queued = m_aggregationPool->submit([this, generation, query, fanOut, delivery] {
        aggregate(generation, query, fanOut, delivery);
    });
    if (!queued) {
        LOG_WARN(rbSearch, "Search %llu not scheduled; conductor is shutting down",
                 static_cast<unsigned long long>(generation));
    }

    LOG_DEBUG(rbSearch, "Search %llu started for '%s'",
              static_cast<unsigned long long>(generation), qUtf8Printable(query.trimmed));
    return generation;
}

std::shared_ptr<Conductor::Delivery> Conductor::connectDelivery(quint64 generation,
                                                                 ResultsCallback callback,
                                                                 QObject* context)
{
    // A superseded search can never deliver, so its connection goes now.
    if (m_pendingDelivery) {
        disconnect(m_pendingDelivery);
    }

    auto delivery = std::make_shared<Delivery>();
    auto connection = std::make_shared<QMetaObject::Connection>();
    const auto generationCounter = m_generation;
    QPointer<Conductor> self(this);

    // Queued with context as receiver: Qt drops the call if context is
    // destroyed first, whichever thread that happens on.
    *connection = connect(this, &Conductor::resultsReady, context,
                          [generation, generationCounter, delivery, connection, self,
                           callback = std::move(callback)](quint64 readyGeneration) {
        if (readyGeneration != generation) {
            return;
        }
        QObject::disconnect(*connection);
        const std::vector<SearchResult> results = std::move(delivery->results);
        if (generationCounter->load() != generation) {
            LOG_DEBUG(rbSearch, "Search %llu superseded before delivery",
                      static_cast<unsigned long long>(generation));
            return;
        }
        if (callback) {
            callback(generation, results);
        }
        if (self) {
            emit self->searchDelivered(generation, static_cast<int>(results.size()));
        }
    }, Qt::QueuedConnection);

    m_pendingDelivery = *connection;
    return delivery;
}

void Conductor::deliverRecents(quint64 generation, const std::shared_ptr<Delivery>& delivery)
{
    std::vector<SearchResult> recents;
    if (m_history) {
        const std::vector<HistoryEntry> entries = m_history->recentEntries(m_config.recentLimit);
        recents.reserve(entries.size());
        for (const HistoryEntry& entry : entries) {
            if (m_resolver) {
                recents.emplace_back(m_resolver->toHistoryCommand(entry, true));
            } else {
                recents.emplace_back(HistoryCommand{entry.command, entry.display, entry.subtitle,
                                                    true, entry.target, nullptr});
            }
        }
    }

    notifyObserver(generation, {});
    post(generation, std::move(recents), delivery);
}

void Conductor::aggregate(quint64 generation, const SearchQuery& query,
                          const std::shared_ptr<FanOut>& fanOut,
                          const std::shared_ptr<Delivery>& delivery)
{
    std::vector<ProviderResult> collected;
    {
        std::unique_lock<std::mutex> lock(fanOut->mutex);
        const auto joined = [&fanOut] { return fanOut->pending == 0; };
        if (m_config.providerTimeoutMs > 0) {
            if (!fanOut->cv.wait_for(lock, std::chrono::milliseconds(m_config.providerTimeoutMs),
                                     joined)) {
                LOG_WARN(rbSearch, "Search %llu: %d providers timed out after %d ms",
                         static_cast<unsigned long long>(generation),
                         static_cast<int>(fanOut->pending), m_config.providerTimeoutMs);
            }
        } else {
            fanOut->cv.wait(lock, joined);
        }
        fanOut->closed = true;
        collected = std::move(fanOut->collected);
    }

    if (m_generation->load() != generation) {
        LOG_DEBUG(rbSearch, "Search %llu superseded before rerank",
                  static_cast<unsigned long long>(generation));
        return;
    }

    std::vector<RankedResult> ranked = ResultReranker::rerank(collected, query);

    std::vector<SearchResult> results;
    results.reserve(ranked.size());
    QHash<QString, int> scores;
    scores.reserve(static_cast<int>(ranked.size()));
    for (RankedResult& r : ranked) {
        scores.insert(r.result.identityKey(), r.score);
        results.push_back(std::move(r.result));
    }

    LOG_DEBUG(rbSearch, "Search %llu: %d candidates, %d ranked",
              static_cast<unsigned long long>(generation),
              static_cast<int>(collected.size()), static_cast<int>(results.size()));

    notifyObserver(generation, scores);
    post(generation, std::move(results), delivery);
}

void Conductor::post(quint64 generation, std::vector<SearchResult> results,
                     const std::shared_ptr<Delivery>& delivery)
{
    delivery->results = std::move(results);
    emit resultsReady(generation);
}

} // namespace rb
