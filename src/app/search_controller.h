#pragma once

#include "core/query/query_classifier.h"
#include "core/shared/search_result.h"

#include <QObject>
#include <QTimer>
#include <QVariantList>
#include <QVariantMap>

#include <memory>
#include <vector>

namespace rb {

class CommandHistory;
class Conductor;
class DebugScoreRecorder;

// SearchController: caller-facing search state for a launcher window.
//
// Owns the typed query, the delivered result list and the selection. A URL
// or path typed directly is shown ahead of the conductor's results, with
// conductor results of the same identity removed.
class SearchController : public QObject {
    Q_OBJECT

    Q_PROPERTY(QString query READ query WRITE setQuery NOTIFY queryChanged)
    Q_PROPERTY(QVariantList resultRows READ resultRows NOTIFY resultRowsChanged)
    Q_PROPERTY(bool isSearching READ isSearching NOTIFY isSearchingChanged)
    Q_PROPERTY(int selectedIndex READ selectedIndex WRITE setSelectedIndex NOTIFY selectedIndexChanged)

public:
    SearchController(Conductor* conductor,
                     std::shared_ptr<CommandHistory> history,
                     QueryClassifier classifier = QueryClassifier(),
                     QObject* parent = nullptr);
    ~SearchController() override;

    void setDebounceInterval(int ms);
    void setScoreRecorder(const DebugScoreRecorder* recorder);

    QString query() const;
    void setQuery(const QString& query);

    const std::vector<SearchResult>& results() const { return m_results; }
    QVariantList resultRows() const;
    bool isSearching() const;

    int selectedIndex() const;
    void setSelectedIndex(int index);

    // Records the result at index as a successful run. The typed query is
    // the stored command; history rows keep their own command and files are
    // stored by path.
    Q_INVOKABLE bool recordSuccess(int index);
    Q_INVOKABLE bool removeHistoryEntry(const QString& command);

    // Inline autocomplete: the typed text extended to the most recent
    // history command it prefixes, or an empty string when no command
    // strictly extends it.
    Q_INVOKABLE QString completionFor(const QString& typed) const;

    Q_INVOKABLE void clearResults();
    Q_INVOKABLE void moveSelection(int delta);

signals:
    void queryChanged();
    void resultRowsChanged();
    void isSearchingChanged();
    void selectedIndexChanged();
    void resultsDelivered(quint64 generation);

private slots:
    void executeSearch();

private:
    void applyResults(quint64 generation, const std::vector<SearchResult>& results);
    void setSearching(bool searching);

    Conductor* m_conductor = nullptr;
    std::shared_ptr<CommandHistory> m_history;
    QueryClassifier m_classifier;
    const DebugScoreRecorder* m_scoreRecorder = nullptr;

    QString m_query;
    quint64 m_pendingGeneration = 0;
    std::vector<SearchResult> m_pendingSynthetic;
    std::vector<SearchResult> m_results;
    QVariantList m_resultRows;
    bool m_isSearching = false;
    int m_selectedIndex = -1;

    QTimer m_debounceTimer;
};

} // namespace rb
