#include "core/providers/installed_programs_provider.h"
#include "core/catalog/catalog_store.h"
#include "core/programs/program_index.h"
#include "core/query/fuzzy_helper.h"
#include "core/shared/logging.h"

#include <QDir>

namespace rb {

InstalledProgramsProvider::InstalledProgramsProvider(std::shared_ptr<ProgramIndex> index,
                                                     std::shared_ptr<const CatalogStore> catalog,
                                                     InstalledProgramsConfig config,
                                                     ScoringWeights weights)
    : m_index(std::move(index))
    , m_catalog(std::move(catalog))
    , m_config(std::move(config))
    , m_weights(weights)
{
    QString home = m_config.homeDirectory.isEmpty() ? QDir::homePath() : m_config.homeDirectory;
    while (home.endsWith(QLatin1Char('/'))) {
        home.chop(1);
    }
    m_homeLibraryPrefix = normalizedPathForSystemCheck(
        (home + QStringLiteral("/Library/")).toLower());
}

std::vector<ProviderResult> InstalledProgramsProvider::search(const SearchQuery& query)
{
    std::vector<ProviderResult> results;
    if (query.isEmpty() || !m_index) {
        return results;
    }

    const QString wildcard = FuzzyHelper::wildcardPattern(query.lowercased);
    const auto hits = m_index->query(wildcard, m_config.resultLimit);
    if (!hits.has_value()) {
        LOG_WARN(rbPrograms, "Program index query failed for '%s'", qUtf8Printable(wildcard));
        return results;
    }

    results.reserve(hits->size());
    int considered = 0;
    for (const ProgramRecord& hit : *hits) {
        if (++considered > m_config.resultLimit) {
            break;
        }

        const QString nameLower = hit.name.toLower();
        const int score = relevanceScore(nameLower, query.lowercased);
        if (score <= 0) {
            continue;
        }

        std::optional<QString> path;
        if (!hit.path.isEmpty()) {
            path = hit.path;
        }
        if (!shouldInclude(path, score, nameLower, query.lowercased)) {
            continue;
        }

        InstalledProgram program;
        program.name = hit.name;
        program.path = path;
        program.bundleId = hit.bundleId;
        program.description = hit.description;
        if (m_catalog) {
            program.catalogEntry = m_catalog->matchProgram(hit.name, path);
        }

        const bool missingDescription = !program.description.has_value()
            || program.description->isEmpty();
        if (missingDescription && program.catalogEntry.has_value()
            && program.catalogEntry->description.has_value()
            && !program.catalogEntry->description->isEmpty()) {
            program.description = program.catalogEntry->description;
        }

        results.push_back({SearchSource::InstalledPrograms, SearchResult(std::move(program)), score});
    }

    LOG_DEBUG(rbPrograms, "'%s': %d index hits, %d admitted",
              qUtf8Printable(query.lowercased), static_cast<int>(hits->size()),
              static_cast<int>(results.size()));
    return results;
}

int InstalledProgramsProvider::relevanceScore(const QString& nameLower,
                                              const QString& queryLower) const
{
    if (nameLower == queryLower) {
        return m_weights.exactNameWeight;
    }
    if (nameLower.startsWith(queryLower)) {
        return m_weights.namePrefixWeight;
    }

    const QStringList tokens = FuzzyHelper::tokens(nameLower);
    if (tokens.contains(queryLower)) {
        return m_weights.wholeTokenWeight;
    }
    for (const QString& token : tokens) {
        if (token.startsWith(queryLower)) {
            return m_weights.tokenPrefixWeight;
        }
    }

    if (nameLower.contains(queryLower)) {
        return m_weights.nameContainsWeight;
    }
    return m_weights.wildcardOnlyWeight;
}

bool InstalledProgramsProvider::shouldInclude(const std::optional<QString>& path, int score,
                                              const QString& nameLower,
                                              const QString& queryLower) const
{
    if (!path.has_value() || !isSystemOrEmbedded(*path)) {
        return true;
    }
    if (score >= m_weights.exactNameWeight) {
        return true;
    }

    const bool longQuery = queryLower.size() >= m_weights.systemMinQueryLength;
    if (longQuery && nameLower.startsWith(queryLower)) {
        return true;
    }
    if (longQuery && FuzzyHelper::isEditDistanceLeOne(nameLower, queryLower)) {
        return true;
    }
    return false;
}

bool InstalledProgramsProvider::isSystemOrEmbedded(const QString& path) const
{
    const QString normalized = normalizedPathForSystemCheck(path.toLower());

    if (normalized.startsWith(QLatin1String("/system/"))
        && !normalized.startsWith(QLatin1String("/system/volumes/"))) {
        return true;
    }
    if (normalized.startsWith(QLatin1String("/library/"))) {
        return true;
    }
    if (normalized.startsWith(m_homeLibraryPrefix)) {
        return true;
    }

    // Helpers nested inside another program bundle.
    const QStringList components = normalized.split(QLatin1Char('/'), Qt::SkipEmptyParts);
    for (int i = 0; i + 1 < components.size(); ++i) {
        if (components.at(i).endsWith(QLatin1String(".app"))) {
            return true;
        }
    }
    return false;
}

QString InstalledProgramsProvider::normalizedPathForSystemCheck(const QString& lowerPath)
{
    static const QString kDataPrefix = QStringLiteral("/system/volumes/data");
    if (!lowerPath.startsWith(kDataPrefix)) {
        return lowerPath;
    }

    const QString remainder = lowerPath.mid(kDataPrefix.size());
    if (remainder.isEmpty()) {
        return QStringLiteral("/");
    }
    if (!remainder.startsWith(QLatin1Char('/'))) {
        return QLatin1Char('/') + remainder;
    }
    return remainder;
}

} // namespace rb
