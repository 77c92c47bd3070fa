#pragma once

#include "core/history/history_target.h"

#include <QString>
#include <QStringList>

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace rb {

struct HistoryEntry {
    QString command;
    std::optional<QString> display;
    std::optional<QString> subtitle;
    std::optional<HistoryTarget> target;
};

struct HistoryMatch {
    HistoryEntry entry;
    int score = 0;
    int index = 0;  // position in the store; lower is more recent
};

// HistoryStorage: durable backing for CommandHistory.
//
// load() returns nullopt when the stored data cannot be read at all; the
// history then starts empty. save() persists the full ordered list.
class HistoryStorage {
public:
    virtual ~HistoryStorage() = default;

    virtual std::optional<std::vector<HistoryEntry>> load() = 0;
    virtual bool save(const std::vector<HistoryEntry>& entries) = 0;
};

struct CommandHistoryConfig {
    int maxEntries = 200;
};

// CommandHistory: recency-ordered list of successfully run commands.
//
// Entries are most-recent-first and unique case-insensitively: recording an
// existing command moves it to the front. A single mutex guards the list;
// providers read concurrently with the occasional writer. Writes are
// persisted through the optional HistoryStorage in the order they happen.
//
// Fuzzy match tiers never overlap, for any input length:
//   exact         300
//   prefix        260
//   substring     200 + max(0, 60 - offset)          -> [200, 259]
//   subsequence   min(199, 100 + sum(max(1, 15 - gap))) -> [101, 199]
class CommandHistory {
public:
    static constexpr int kExactScore = 300;
    static constexpr int kPrefixScore = 260;
    static constexpr int kSubstringBase = 200;
    static constexpr int kProximityWindow = 60;
    static constexpr int kSubsequenceBase = 100;
    static constexpr int kSubsequenceMax = kSubstringBase - 1;
    static constexpr int kAdjacencyWeight = 15;

    explicit CommandHistory(std::unique_ptr<HistoryStorage> storage = nullptr,
                            CommandHistoryConfig config = {});
    ~CommandHistory();

    CommandHistory(const CommandHistory&) = delete;
    CommandHistory& operator=(const CommandHistory&) = delete;

    // Records a command the user launched successfully. Blank commands are
    // ignored. Returns false only when persisting failed.
    bool record(const QString& command,
                const std::optional<QString>& display = std::nullopt,
                const std::optional<QString>& subtitle = std::nullopt,
                const std::optional<HistoryTarget>& target = std::nullopt);

    // Removes the entry matching command case-insensitively.
    // Returns true if an entry was removed.
    bool remove(const QString& command);

    void clear();

    std::vector<HistoryEntry> recentEntries(int limit) const;
    std::vector<HistoryEntry> entries() const;
    int size() const;

    // First stored command that completes prefix, in recency order.
    std::optional<QString> bestCompletion(const QString& prefix) const;

    // Stored commands that start with prefix, in recency order.
    QStringList completions(const QString& prefix, int limit = 10) const;

    // Scored matches, best first; ties resolved by recency.
    std::vector<HistoryMatch> fuzzyMatches(const QString& query, int limit = 5) const;

    // Scores candidate against an already lowercased query. Returns nullopt
    // when the query is not even a subsequence of the candidate.
    static std::optional<int> fuzzyScore(const QString& candidate,
                                         const QString& lowercasedQuery);

private:
    static std::vector<HistoryEntry> sanitize(std::vector<HistoryEntry> entries, int maxEntries);
    bool persist(const std::vector<HistoryEntry>& snapshot);

    std::unique_ptr<HistoryStorage> m_storage;
    CommandHistoryConfig m_config;

    mutable std::mutex m_mutex;
    std::mutex m_persistMutex;
    std::vector<HistoryEntry> m_entries;
};

} // namespace rb
