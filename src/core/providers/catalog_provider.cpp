#include "core/providers/catalog_provider.h"
#include "core/catalog/catalog_store.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace rb {

namespace {

// exact / prefix / contains tier of one field, or 0 when it does not match.
int tierScore(const QString& fieldLower, const QString& queryLower,
              int exact, int prefix, int contains)
{
    if (fieldLower.isEmpty()) {
        return 0;
    }
    if (fieldLower == queryLower) {
        return exact;
    }
    if (fieldLower.startsWith(queryLower)) {
        return prefix;
    }
    if (fieldLower.contains(queryLower)) {
        return contains;
    }
    return 0;
}

} // namespace

CatalogProvider::CatalogProvider(std::shared_ptr<const CatalogStore> catalog,
                                 ScoringWeights weights)
    : m_catalog(std::move(catalog))
    , m_weights(weights)
{
}

std::vector<ProviderResult> CatalogProvider::search(const SearchQuery& query)
{
    std::vector<ProviderResult> results;
    if (query.isEmpty() || !m_catalog) {
        return results;
    }

    const QString& lower = query.lowercased;
    for (const CatalogEntry& entry : m_catalog->entries()) {
        if (!matches(entry, lower)) {
            continue;
        }
        const int score = adjustedScore(entry, relevanceScore(entry, lower));
        results.push_back({SearchSource::Catalog, SearchResult(entry), score});
    }

    LOG_DEBUG(rbCatalog, "'%s': %d catalog matches",
              qUtf8Printable(lower), static_cast<int>(results.size()));
    return results;
}

bool CatalogProvider::matches(const CatalogEntry& entry, const QString& queryLower)
{
    for (const QString& name : entry.names) {
        if (name.toLower().contains(queryLower)) {
            return true;
        }
    }
    if (entry.token.toLower().contains(queryLower)
        || entry.fullToken.toLower().contains(queryLower)) {
        return true;
    }
    return entry.description.has_value()
        && entry.description->toLower().contains(queryLower);
}

int CatalogProvider::relevanceScore(const CatalogEntry& entry, const QString& queryLower) const
{
    const int exact = m_weights.exactNameWeight;
    const int prefix = m_weights.namePrefixWeight;
    const int contains = m_weights.nameContainsWeight;

    int best = 0;
    best = std::max(best, tierScore(entry.displayName().toLower(), queryLower,
                                    exact, prefix, contains));
    best = std::max(best, tierScore(entry.token.toLower(), queryLower,
                                    exact, prefix, contains));
    best = std::max(best, tierScore(entry.fullToken.toLower(), queryLower,
                                    exact, prefix, contains));

    for (int i = 1; i < entry.names.size(); ++i) {
        best = std::max(best, tierScore(entry.names.at(i).toLower(), queryLower,
                                        m_weights.altNameExactWeight,
                                        m_weights.altNamePrefixWeight,
                                        m_weights.altNameContainsWeight));
    }

    if (best == 0 && entry.description.has_value()
        && entry.description->toLower().contains(queryLower)) {
        best = m_weights.descriptionContainsWeight;
    }
    if (best == 0) {
        best = m_weights.catalogFallbackWeight;
    }
    return best;
}

int CatalogProvider::adjustedScore(const CatalogEntry& entry, int baseScore) const
{
    if (!entry.deprecated) {
        return baseScore;
    }
    return std::max(baseScore - m_weights.deprecationPenalty, 0);
}

} // namespace rb
