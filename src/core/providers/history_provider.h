#pragma once

#include "core/providers/search_provider.h"
#include "core/shared/scoring_types.h"

#include <memory>

namespace rb {

class CommandHistory;
class TargetResolver;

// HistoryProvider: previously successful commands that fuzzily match.
//
// score = base + (K - rank) * step + fuzzy score, where rank is the position
// in the store's top-K list. A command equal to the query is lifted to the
// exact floor. Matches trailing the best one by more than the prune window
// are dropped.
class HistoryProvider : public SearchProvider {
public:
    HistoryProvider(std::shared_ptr<const CommandHistory> history,
                    std::shared_ptr<const TargetResolver> resolver,
                    int matchLimit = 8,
                    ScoringWeights weights = {});

    SearchSource source() const override { return SearchSource::CommandHistory; }
    std::vector<ProviderResult> search(const SearchQuery& query) override;

private:
    std::shared_ptr<const CommandHistory> m_history;
    std::shared_ptr<const TargetResolver> m_resolver;
    int m_matchLimit;
    ScoringWeights m_weights;
};

} // namespace rb
