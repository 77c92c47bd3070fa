#include "core/history/command_history.h"
#include "core/shared/logging.h"

#include <QSet>

#include <algorithm>

namespace rb {

CommandHistory::CommandHistory(std::unique_ptr<HistoryStorage> storage,
                               CommandHistoryConfig config)
    : m_storage(std::move(storage))
    , m_config(config)
{
    if (m_config.maxEntries < 1) {
        LOG_WARN(rbHistory, "maxEntries %d clamped to 1", m_config.maxEntries);
        m_config.maxEntries = 1;
    }

    if (!m_storage) {
        return;
    }

    auto loaded = m_storage->load();
    if (!loaded.has_value()) {
        LOG_WARN(rbHistory, "Command history could not be loaded; starting empty");
        return;
    }

    m_entries = sanitize(std::move(*loaded), m_config.maxEntries);
    LOG_INFO(rbHistory, "Loaded %d history entries", static_cast<int>(m_entries.size()));
}

CommandHistory::~CommandHistory() = default;

std::vector<HistoryEntry> CommandHistory::sanitize(std::vector<HistoryEntry> entries,
                                                   int maxEntries)
{
    std::vector<HistoryEntry> result;
    result.reserve(std::min(entries.size(), static_cast<size_t>(maxEntries)));
    QSet<QString> seen;

    for (HistoryEntry& entry : entries) {
        entry.command = entry.command.trimmed();
        if (entry.command.isEmpty()) {
            continue;
        }
        const QString key = entry.command.toLower();
        if (seen.contains(key)) {
            continue;
        }
        seen.insert(key);
        result.push_back(std::move(entry));
        if (static_cast<int>(result.size()) >= maxEntries) {
            break;
        }
    }
    return result;
}

bool CommandHistory::record(const QString& command,
                            const std::optional<QString>& display,
                            const std::optional<QString>& subtitle,
                            const std::optional<HistoryTarget>& target)
{
    const QString trimmed = command.trimmed();
    if (trimmed.isEmpty()) {
        return true;
    }

    HistoryEntry entry;
    entry.command = trimmed;
    if (display.has_value() && !display->trimmed().isEmpty()) {
        entry.display = display->trimmed();
    }
    if (subtitle.has_value() && !subtitle->trimmed().isEmpty()) {
        entry.subtitle = subtitle->trimmed();
    }
    entry.target = target;

    std::lock_guard<std::mutex> persistLock(m_persistMutex);
    std::vector<HistoryEntry> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const QString key = trimmed.toLower();
        auto existing = std::find_if(m_entries.begin(), m_entries.end(),
                                     [&key](const HistoryEntry& e) {
                                         return e.command.toLower() == key;
                                     });
        if (existing != m_entries.end()) {
            m_entries.erase(existing);
        }
        m_entries.insert(m_entries.begin(), std::move(entry));

        if (static_cast<int>(m_entries.size()) > m_config.maxEntries) {
            m_entries.resize(static_cast<size_t>(m_config.maxEntries));
        }
        snapshot = m_entries;
    }

    LOG_DEBUG(rbHistory, "Recorded command '%s'", qUtf8Printable(trimmed));
    return persist(snapshot);
}

bool CommandHistory::remove(const QString& command)
{
    const QString key = command.trimmed().toLower();
    if (key.isEmpty()) {
        return false;
    }

    std::lock_guard<std::mutex> persistLock(m_persistMutex);
    std::vector<HistoryEntry> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto existing = std::find_if(m_entries.begin(), m_entries.end(),
                                     [&key](const HistoryEntry& e) {
                                         return e.command.toLower() == key;
                                     });
        if (existing == m_entries.end()) {
            return false;
        }
        m_entries.erase(existing);
        snapshot = m_entries;
    }

    LOG_DEBUG(rbHistory, "Removed command '%s'", qUtf8Printable(command.trimmed()));
    if (!persist(snapshot)) {
        LOG_WARN(rbHistory, "Removed command is still present in storage");
    }
    return true;
}

void CommandHistory::clear()
{
    std::lock_guard<std::mutex> persistLock(m_persistMutex);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
    }
    persist({});
}

bool CommandHistory::persist(const std::vector<HistoryEntry>& snapshot)
{
    if (!m_storage) {
        return true;
    }
    if (!m_storage->save(snapshot)) {
        LOG_WARN(rbHistory, "Failed to persist %d history entries",
                 static_cast<int>(snapshot.size()));
        return false;
    }
    return true;
}

std::vector<HistoryEntry> CommandHistory::recentEntries(int limit) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t count = std::min(m_entries.size(), static_cast<size_t>(std::max(limit, 0)));
    return std::vector<HistoryEntry>(m_entries.begin(), m_entries.begin() + count);
}

std::vector<HistoryEntry> CommandHistory::entries() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries;
}

int CommandHistory::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_entries.size());
}

std::optional<QString> CommandHistory::bestCompletion(const QString& prefix) const
{
    const QString lower = prefix.trimmed().toLower();
    if (lower.isEmpty()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const HistoryEntry& entry : m_entries) {
        if (entry.command.toLower().startsWith(lower)) {
            return entry.command;
        }
    }
    return std::nullopt;
}

QStringList CommandHistory::completions(const QString& prefix, int limit) const
{
    QStringList matches;
    const QString lower = prefix.trimmed().toLower();
    if (lower.isEmpty() || limit <= 0) {
        return matches;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const HistoryEntry& entry : m_entries) {
        if (entry.command.toLower().startsWith(lower)) {
            matches.append(entry.command);
            if (matches.size() == limit) {
                break;
            }
        }
    }
    return matches;
}

std::vector<HistoryMatch> CommandHistory::fuzzyMatches(const QString& query, int limit) const
{
    std::vector<HistoryMatch> scored;
    const QString lower = query.trimmed().toLower();
    if (lower.isEmpty() || limit <= 0) {
        return scored;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (size_t i = 0; i < m_entries.size(); ++i) {
            const auto score = fuzzyScore(m_entries[i].command, lower);
            if (!score.has_value()) {
                continue;
            }
            scored.push_back({m_entries[i], *score, static_cast<int>(i)});
        }
    }

    std::sort(scored.begin(), scored.end(),
              [](const HistoryMatch& lhs, const HistoryMatch& rhs) {
                  if (lhs.score != rhs.score) {
                      return lhs.score > rhs.score;
                  }
                  return lhs.index < rhs.index;
              });

    if (scored.size() > static_cast<size_t>(limit)) {
        scored.resize(static_cast<size_t>(limit));
    }
    return scored;
}

std::optional<int> CommandHistory::fuzzyScore(const QString& candidate,
                                              const QString& lowercasedQuery)
{
    if (lowercasedQuery.isEmpty()) {
        return std::nullopt;
    }

    const QString candidateLower = candidate.toLower();
    if (candidateLower == lowercasedQuery) {
        return kExactScore;
    }
    if (candidateLower.startsWith(lowercasedQuery)) {
        return kPrefixScore;
    }

    const int offset = candidateLower.indexOf(lowercasedQuery);
    if (offset >= 0) {
        return kSubstringBase + std::max(0, kProximityWindow - offset);
    }

    // Subsequence: every query character must appear, in order.
    int score = 0;
    int searchIndex = 0;
    for (QChar ch : lowercasedQuery) {
        const int matchIndex = candidateLower.indexOf(ch, searchIndex);
        if (matchIndex < 0) {
            return std::nullopt;
        }
        const int gap = matchIndex - searchIndex;
        score += std::max(kAdjacencyWeight - gap, 1);
        searchIndex = matchIndex + 1;
    }

    return std::min(kSubsequenceMax, kSubsequenceBase + score);
}

} // namespace rb
