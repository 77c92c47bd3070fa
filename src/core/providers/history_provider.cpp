#include "core/providers/history_provider.h"
#include "core/history/command_history.h"
#include "core/search/target_resolver.h"
#include "core/shared/logging.h"

#include <QSet>

#include <algorithm>

namespace rb {

namespace {

bool targetsDeprecatedPackage(const HistoryCommand& command)
{
    if (!command.resolvedTarget) {
        return false;
    }
    if (const auto* entry = command.resolvedTarget->as<CatalogEntry>()) {
        return entry->deprecated;
    }
    if (const auto* program = command.resolvedTarget->as<InstalledProgram>()) {
        return program->catalogEntry.has_value() && program->catalogEntry->deprecated;
    }
    return false;
}

} // namespace

HistoryProvider::HistoryProvider(std::shared_ptr<const CommandHistory> history,
                                 std::shared_ptr<const TargetResolver> resolver,
                                 int matchLimit,
                                 ScoringWeights weights)
    : m_history(std::move(history))
    , m_resolver(std::move(resolver))
    , m_matchLimit(matchLimit)
    , m_weights(weights)
{
}

std::vector<ProviderResult> HistoryProvider::search(const SearchQuery& query)
{
    std::vector<ProviderResult> results;
    if (query.isEmpty() || !m_history) {
        return results;
    }

    const std::vector<HistoryMatch> matches = m_history->fuzzyMatches(query.trimmed, m_matchLimit);

    QSet<QString> added;
    int topScore = 0;
    for (size_t rank = 0; rank < matches.size(); ++rank) {
        const HistoryEntry& entry = matches[rank].entry;
        const QString command = entry.command.trimmed();
        if (command.isEmpty()) {
            continue;
        }
        const QString lower = command.toLower();
        if (added.contains(lower)) {
            continue;
        }
        added.insert(lower);

        const int recencyBoost = std::max(0, (m_matchLimit - static_cast<int>(rank))
                                                 * m_weights.historyRecencyStep);
        int score = m_weights.historyBaseWeight + recencyBoost + matches[rank].score;
        if (lower == query.lowercased) {
            score = std::max(score, m_weights.historyExactFloor);
        }

        HistoryCommand row = m_resolver
            ? m_resolver->toHistoryCommand(entry, false)
            : HistoryCommand{command, entry.display, entry.subtitle, false, entry.target, nullptr};
        row.command = command;
        if (targetsDeprecatedPackage(row)) {
            score = std::max(score - m_weights.deprecationPenalty, 0);
        }

        topScore = std::max(topScore, score);
        results.push_back({SearchSource::CommandHistory, SearchResult(std::move(row)), score});
    }

    const int floor = topScore - m_weights.historyPruneWindow;
    results.erase(std::remove_if(results.begin(), results.end(),
                                 [floor](const ProviderResult& r) { return r.score < floor; }),
                  results.end());

    LOG_DEBUG(rbHistory, "'%s': %d history matches, %d kept",
              qUtf8Printable(query.trimmed), static_cast<int>(matches.size()),
              static_cast<int>(results.size()));
    return results;
}

} // namespace rb
