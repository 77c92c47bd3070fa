#include "core/search/debug_score_recorder.h"

namespace rb {

void DebugScoreRecorder::record(quint64 generation, const QHash<QString, int>& scoresByIdentity)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (generation < m_generation) {
        return;
    }
    m_generation = generation;
    m_scores = scoresByIdentity;
}

std::optional<int> DebugScoreRecorder::score(const SearchResult& result) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_scores.constFind(result.identityKey());
    if (it == m_scores.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

quint64 DebugScoreRecorder::generation() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_generation;
}

int DebugScoreRecorder::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_scores.size());
}

} // namespace rb
