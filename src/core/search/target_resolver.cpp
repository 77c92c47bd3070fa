#include "core/search/target_resolver.h"
#include "core/catalog/catalog_store.h"
#include "core/shared/logging.h"

#include <QFileInfo>

namespace rb {

TargetResolver::TargetResolver(std::shared_ptr<const CatalogStore> catalog)
    : m_catalog(std::move(catalog))
{
}

std::optional<SearchResult> TargetResolver::resolve(const HistoryTarget& target) const
{
    if (target.ref.isEmpty()) {
        return std::nullopt;
    }

    switch (target.kind) {
    case HistoryTarget::Kind::InstalledProgram: {
        const QFileInfo info(target.ref);
        if (!info.exists()) {
            LOG_DEBUG(rbSearch, "History target no longer installed: %s",
                      qUtf8Printable(target.ref));
            return std::nullopt;
        }
        InstalledProgram program;
        program.name = (target.name.has_value() && !target.name->isEmpty())
            ? *target.name
            : info.completeBaseName();
        program.path = target.ref;
        program.bundleId = target.bundleId;
        if (m_catalog) {
            program.catalogEntry = m_catalog->matchProgram(program.name, program.path);
            if (program.catalogEntry.has_value()) {
                program.description = program.catalogEntry->description;
            }
        }
        return SearchResult(std::move(program));
    }
    case HistoryTarget::Kind::CatalogEntry: {
        if (!m_catalog) {
            return std::nullopt;
        }
        auto entry = m_catalog->lookupByNameOrToken(target.ref);
        if (!entry.has_value()) {
            return std::nullopt;
        }
        return SearchResult(std::move(*entry));
    }
    case HistoryTarget::Kind::Url:
        return SearchResult(UrlTarget{target.ref});
    case HistoryTarget::Kind::FileSystemEntry: {
        const QFileInfo info(target.ref);
        if (!info.exists()) {
            return std::nullopt;
        }
        FileSystemEntry entry;
        entry.path = info.absoluteFilePath();
        entry.isDirectory = info.isDir();
        return SearchResult(std::move(entry));
    }
    }
    return std::nullopt;
}

HistoryCommand TargetResolver::toHistoryCommand(const HistoryEntry& entry, bool isRecent) const
{
    HistoryCommand command;
    command.command = entry.command;
    command.display = entry.display;
    command.subtitle = entry.subtitle;
    command.isRecent = isRecent;
    command.target = entry.target;
    if (entry.target.has_value()) {
        auto resolved = resolve(*entry.target);
        if (resolved.has_value()) {
            command.resolvedTarget = std::make_shared<const SearchResult>(std::move(*resolved));
        }
    }
    return command;
}

} // namespace rb
