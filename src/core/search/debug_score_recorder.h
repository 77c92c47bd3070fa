#pragma once

#include "core/shared/search_result.h"

#include <QHash>
#include <QString>

#include <mutex>
#include <optional>

namespace rb {

// Keeps the final scores of the most recently delivered search so a debug
// view can print them next to each row. Fed through Conductor's score
// observer; safe to update from the aggregation thread.
class DebugScoreRecorder {
public:
    void record(quint64 generation, const QHash<QString, int>& scoresByIdentity);

    std::optional<int> score(const SearchResult& result) const;
    quint64 generation() const;
    int size() const;

private:
    mutable std::mutex m_mutex;
    quint64 m_generation = 0;
    QHash<QString, int> m_scores;
};

} // namespace rb
