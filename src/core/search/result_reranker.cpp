#include "core/search/result_reranker.h"

#include <QFileInfo>
#include <QHash>
#include <QSet>

#include <algorithm>

namespace rb {

namespace {

bool isExactPackageMatch(const CatalogEntry& entry, const QString& queryLower)
{
    return entry.displayName().toLower() == queryLower
        || entry.token.toLower() == queryLower
        || entry.fullToken.toLower() == queryLower;
}

// Names an installed program is known by when matching catalog app
// artifacts: its file name, that name without extension, and its display
// name. A ".desktop" entry thus still matches a "Visual Studio Code.app"
// artifact through its name.
void addInstalledKeys(const InstalledProgram& program, QSet<QString>& keys)
{
    if (program.path.has_value() && !program.path->isEmpty()) {
        const QFileInfo info(*program.path);
        keys.insert(info.fileName().toLower());
        keys.insert(info.completeBaseName().toLower());
    }
    if (!program.name.isEmpty()) {
        keys.insert(program.name.toLower());
    }
}

bool isArtifactInstalled(const QString& app, const QSet<QString>& installedKeys)
{
    const QFileInfo info(app);
    return installedKeys.contains(info.fileName().toLower())
        || installedKeys.contains(info.completeBaseName().toLower());
}

} // namespace

int ResultReranker::priority(const SearchResult& result, const SearchQuery& query)
{
    switch (result.kind()) {
    case ResultKind::InstalledProgram:
        return result.as<InstalledProgram>()->name.toLower() == query.lowercased
            ? kInstalledExactTier
            : kPrimaryTier;
    case ResultKind::HistoryCommand:
        return result.as<HistoryCommand>()->command.toLower() == query.lowercased
            ? kHistoryExactTier
            : kPrimaryTier;
    case ResultKind::CatalogEntry:
        return isExactPackageMatch(*result.as<CatalogEntry>(), query.lowercased)
            ? kPrimaryTier
            : kSecondaryTier;
    case ResultKind::Url:
    case ResultKind::FileSystemEntry:
        return kSecondaryTier;
    }
    return kSecondaryTier;
}

std::vector<RankedResult> ResultReranker::rerank(const std::vector<ProviderResult>& results,
                                                 const SearchQuery& query)
{
    std::vector<ProviderResult> installed;
    std::vector<ProviderResult> packages;
    std::vector<ProviderResult> history;
    QSet<QString> installedKeys;
    QHash<QString, size_t> installedIndexByDisplay;

    for (const ProviderResult& r : results) {
        switch (r.result.kind()) {
        case ResultKind::InstalledProgram: {
            addInstalledKeys(*r.result.as<InstalledProgram>(), installedKeys);
            installedIndexByDisplay.insert(r.result.displayName().toLower(), installed.size());
            installed.push_back(r);
            break;
        }
        case ResultKind::CatalogEntry:
            packages.push_back(r);
            break;
        case ResultKind::HistoryCommand:
            history.push_back(r);
            break;
        case ResultKind::Url:
        case ResultKind::FileSystemEntry:
            break;
        }
    }

    std::vector<ProviderResult> merged;
    merged.reserve(installed.size() + history.size() + packages.size());

    std::vector<ProviderResult> remainingHistory;
    // Only a history row that carries its own display name folds; a bare
    // typed command stays visible even when it names a program.
    for (const ProviderResult& r : history) {
        const std::optional<QString>& display = r.result.as<HistoryCommand>()->display;
        const QString key = display.has_value() ? display->toLower() : QString();
        const auto it = installedIndexByDisplay.constFind(key);
        if (!key.isEmpty() && it != installedIndexByDisplay.constEnd()) {
            installed[it.value()].score += r.score;
            continue;
        }
        remainingHistory.push_back(r);
    }

    merged.insert(merged.end(), installed.begin(), installed.end());
    merged.insert(merged.end(), remainingHistory.begin(), remainingHistory.end());
    for (const ProviderResult& r : packages) {
        const CatalogEntry* entry = r.result.as<CatalogEntry>();
        const bool alreadyInstalled = std::any_of(
            entry->appArtifacts.begin(), entry->appArtifacts.end(),
            [&installedKeys](const QString& app) {
                return isArtifactInstalled(app, installedKeys);
            });
        if (!alreadyInstalled) {
            merged.push_back(r);
        }
    }

    std::vector<RankedResult> ranked;
    ranked.reserve(merged.size());
    for (ProviderResult& r : merged) {
        const int tier = priority(r.result, query);
        ranked.push_back({std::move(r.result), r.score, tier});
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const RankedResult& lhs, const RankedResult& rhs) {
                         if (lhs.tier != rhs.tier) {
                             return lhs.tier > rhs.tier;
                         }
                         if (lhs.score != rhs.score) {
                             return lhs.score > rhs.score;
                         }
                         return lhs.result.displayName().compare(rhs.result.displayName(),
                                                                 Qt::CaseInsensitive) < 0;
                     });

    std::vector<RankedResult> unique;
    unique.reserve(ranked.size());
    QSet<QString> seenIdentities;
    QSet<QString> seenDisplayNames;
    for (RankedResult& r : ranked) {
        const QString identity = r.result.identityKey();
        if (seenIdentities.contains(identity)) {
            continue;
        }
        seenIdentities.insert(identity);

        const QString displayKey = r.result.displayName().toLower();
        if (seenDisplayNames.contains(displayKey) && !r.result.isHistory()) {
            continue;
        }
        seenDisplayNames.insert(displayKey);
        unique.push_back(std::move(r));
    }
    return unique;
}

} // namespace rb
