#pragma once

#include "core/providers/search_provider.h"
#include "core/shared/scoring_types.h"

#include <memory>

namespace rb {

class CatalogStore;

// CatalogProvider: substring search over the offline package catalog.
//
// A package matches when the query is a substring of any display name, the
// token, the full token or the description. Deprecated packages are demoted,
// never dropped.
class CatalogProvider : public SearchProvider {
public:
    explicit CatalogProvider(std::shared_ptr<const CatalogStore> catalog,
                             ScoringWeights weights = {});

    SearchSource source() const override { return SearchSource::Catalog; }
    std::vector<ProviderResult> search(const SearchQuery& query) override;

    static bool matches(const CatalogEntry& entry, const QString& queryLower);

    // Best score over every field, before the deprecation penalty.
    int relevanceScore(const CatalogEntry& entry, const QString& queryLower) const;

    int adjustedScore(const CatalogEntry& entry, int baseScore) const;

private:
    std::shared_ptr<const CatalogStore> m_catalog;
    ScoringWeights m_weights;
};

} // namespace rb
