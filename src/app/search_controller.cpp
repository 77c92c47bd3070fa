#include "search_controller.h"
#include "result_presentation.h"
#include "core/history/command_history.h"
#include "core/search/conductor.h"
#include "core/shared/logging.h"

#include <QSet>

namespace rb {

SearchController::SearchController(Conductor* conductor,
                                   std::shared_ptr<CommandHistory> history,
                                   QueryClassifier classifier,
                                   QObject* parent)
    : QObject(parent)
    , m_conductor(conductor)
    , m_history(std::move(history))
    , m_classifier(std::move(classifier))
{
    m_debounceTimer.setSingleShot(true);
    m_debounceTimer.setInterval(0);
    connect(&m_debounceTimer, &QTimer::timeout,
            this, &SearchController::executeSearch);
}

SearchController::~SearchController() = default;

void SearchController::setDebounceInterval(int ms)
{
    m_debounceTimer.setInterval(ms < 0 ? 0 : ms);
}

void SearchController::setScoreRecorder(const DebugScoreRecorder* recorder)
{
    m_scoreRecorder = recorder;
}

QString SearchController::query() const
{
    return m_query;
}

void SearchController::setQuery(const QString& query)
{
    if (m_query == query) {
        return;
    }

    m_query = query;
    emit queryChanged();

    if (m_query.trimmed().isEmpty()) {
        // Recent commands replace the list right away
        m_debounceTimer.stop();
        executeSearch();
        return;
    }

    // Restart the debounce timer
    m_debounceTimer.start();
}

QVariantList SearchController::resultRows() const
{
    return m_resultRows;
}

bool SearchController::isSearching() const
{
    return m_isSearching;
}

void SearchController::setSearching(bool searching)
{
    if (m_isSearching == searching) {
        return;
    }
    m_isSearching = searching;
    emit isSearchingChanged();
}

int SearchController::selectedIndex() const
{
    return m_selectedIndex;
}

void SearchController::setSelectedIndex(int index)
{
    if (m_resultRows.isEmpty()) {
        index = -1;
    } else {
        if (index < -1) {
            index = -1;
        }
        if (index >= m_resultRows.size()) {
            index = m_resultRows.size() - 1;
        }
    }

    if (m_selectedIndex == index) {
        return;
    }

    m_selectedIndex = index;
    emit selectedIndexChanged();
}

void SearchController::moveSelection(int delta)
{
    if (delta == 0 || m_resultRows.isEmpty()) {
        return;
    }

    if (m_selectedIndex < 0) {
        setSelectedIndex(delta > 0 ? 0 : m_resultRows.size() - 1);
        return;
    }

    setSelectedIndex(qBound(0, m_selectedIndex + (delta > 0 ? 1 : -1),
                            static_cast<int>(m_resultRows.size()) - 1));
}

void SearchController::clearResults()
{
    m_debounceTimer.stop();
    m_pendingSynthetic.clear();
    m_results.clear();
    m_resultRows.clear();
    m_selectedIndex = -1;
    setSearching(false);
    emit resultRowsChanged();
    emit selectedIndexChanged();
}

void SearchController::executeSearch()
{
    if (!m_conductor) {
        LOG_WARN(rbSearch, "SearchController: no conductor attached");
        return;
    }

    m_pendingSynthetic = m_classifier.classify(m_query).results();
    setSearching(true);

    m_pendingGeneration = m_conductor->search(
        m_query,
        [this](quint64 generation, const std::vector<SearchResult>& results) {
            applyResults(generation, results);
        },
        this);

    LOG_DEBUG(rbSearch, "SearchController: search %llu for '%s' (%d direct hits)",
              static_cast<unsigned long long>(m_pendingGeneration),
              qUtf8Printable(m_query.trimmed()), static_cast<int>(m_pendingSynthetic.size()));
}

void SearchController::applyResults(quint64 generation, const std::vector<SearchResult>& results)
{
    if (generation != m_pendingGeneration) {
        return;
    }

    m_results = m_pendingSynthetic;
    QSet<QString> shown;
    for (const SearchResult& result : m_results) {
        shown.insert(result.identityKey());
    }
    for (const SearchResult& result : results) {
        if (shown.contains(result.identityKey())) {
            continue;
        }
        m_results.push_back(result);
    }

    m_resultRows.clear();
    m_resultRows.reserve(static_cast<int>(m_results.size()));
    for (const SearchResult& result : m_results) {
        m_resultRows.append(ResultPresentation::toRow(result, m_scoreRecorder));
    }

    setSearching(false);
    emit resultRowsChanged();

    m_selectedIndex = m_resultRows.isEmpty() ? -1 : 0;
    emit selectedIndexChanged();
    emit resultsDelivered(generation);
}

bool SearchController::recordSuccess(int index)
{
    if (!m_history || index < 0 || index >= static_cast<int>(m_results.size())) {
        return false;
    }

    const SearchResult& result = m_results[static_cast<size_t>(index)];
    const QString typed = m_query.trimmed();

    // History rows re-run as whatever they resolve to.
    const SearchResult* effective = &result;
    QString command = typed.isEmpty() ? result.displayName() : typed;
    if (const auto* history = result.as<HistoryCommand>()) {
        command = history->command;
        if (history->resolvedTarget) {
            effective = history->resolvedTarget.get();
        } else {
            return m_history->record(command, history->display, history->subtitle,
                                     history->target);
        }
    }
    if (const auto* entry = effective->as<FileSystemEntry>()) {
        command = entry->path;
    }

    return m_history->record(command, effective->displayName(),
                             ResultPresentation::subtitle(*effective),
                             HistoryTarget::fromResult(*effective));
}

bool SearchController::removeHistoryEntry(const QString& command)
{
    if (!m_history || !m_history->remove(command)) {
        return false;
    }
    if (m_query.trimmed().isEmpty()) {
        executeSearch();
    }
    return true;
}

QString SearchController::completionFor(const QString& typed) const
{
    if (!m_history || typed.trimmed().isEmpty()) {
        return QString();
    }

    const auto completion = m_history->bestCompletion(typed);
    if (!completion.has_value() || completion->size() <= typed.size()
        || !completion->startsWith(typed, Qt::CaseInsensitive)) {
        return QString();
    }
    // Keep what the user typed; append the remainder of the stored command.
    return typed + completion->mid(typed.size());
}

} // namespace rb
