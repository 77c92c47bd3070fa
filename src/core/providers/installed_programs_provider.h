#pragma once

#include "core/providers/search_provider.h"
#include "core/shared/scoring_types.h"

#include <memory>

namespace rb {

class CatalogStore;
class ProgramIndex;

struct InstalledProgramsConfig {
    int resultLimit = 300;
    QString homeDirectory;  // empty means QDir::homePath()
};

// InstalledProgramsProvider: scores programs reported by the OS program index.
//
// The index is queried with the glyph-interleaved wildcard of the query, so it
// returns a superset of plausible hits; this provider then scores each name
// and hides system or embedded programs unless the match is strong.
class InstalledProgramsProvider : public SearchProvider {
public:
    InstalledProgramsProvider(std::shared_ptr<ProgramIndex> index,
                              std::shared_ptr<const CatalogStore> catalog,
                              InstalledProgramsConfig config = {},
                              ScoringWeights weights = {});

    SearchSource source() const override { return SearchSource::InstalledPrograms; }
    std::vector<ProviderResult> search(const SearchQuery& query) override;

    int relevanceScore(const QString& nameLower, const QString& queryLower) const;

    bool shouldInclude(const std::optional<QString>& path, int score,
                       const QString& nameLower, const QString& queryLower) const;

    bool isSystemOrEmbedded(const QString& path) const;

    // Collapses the /System/Volumes/Data firmlink onto '/'. Expects a
    // lowercased path.
    static QString normalizedPathForSystemCheck(const QString& lowerPath);

private:
    std::shared_ptr<ProgramIndex> m_index;
    std::shared_ptr<const CatalogStore> m_catalog;
    InstalledProgramsConfig m_config;
    ScoringWeights m_weights;
    QString m_homeLibraryPrefix;
};

} // namespace rb
