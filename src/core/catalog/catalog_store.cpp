#include "core/catalog/catalog_store.h"
#include "core/shared/logging.h"

#include <QFileInfo>

namespace rb {

QString CatalogEntry::displayName() const
{
    if (!names.isEmpty() && !names.first().isEmpty()) {
        return names.first();
    }
    return token;
}

bool CatalogEntry::operator==(const CatalogEntry& other) const
{
    return token == other.token
        && fullToken == other.fullToken
        && names == other.names
        && description == other.description
        && homepage == other.homepage
        && url == other.url
        && version == other.version
        && sha256 == other.sha256
        && deprecated == other.deprecated
        && appArtifacts == other.appArtifacts;
}

CatalogStore::CatalogStore(std::vector<CatalogEntry> entries)
    : m_entries(std::move(entries))
{
    for (size_t i = 0; i < m_entries.size(); ++i) {
        const CatalogEntry& entry = m_entries[i];
        m_tokenIndex.insert(entry.token.toLower(), i);
        m_nameIndex.insert(entry.displayName().toLower(), i);
        for (const QString& name : entry.names) {
            m_nameIndex.insert(name.toLower(), i);
        }
        for (const QString& app : entry.appArtifacts) {
            m_appFilenameIndex.insert(app.toLower(), i);
        }
    }

    LOG_INFO(rbCatalog, "CatalogStore built: %d entries, %d names, %d app filenames",
             static_cast<int>(m_entries.size()),
             static_cast<int>(m_nameIndex.size()),
             static_cast<int>(m_appFilenameIndex.size()));
}

std::optional<CatalogEntry> CatalogStore::lookupByNameOrToken(const QString& raw) const
{
    const QString key = raw.toLower();
    if (key.isEmpty()) {
        return std::nullopt;
    }

    auto it = m_nameIndex.constFind(key);
    if (it != m_nameIndex.constEnd()) {
        return m_entries[it.value()];
    }

    it = m_tokenIndex.constFind(key);
    if (it != m_tokenIndex.constEnd()) {
        return m_entries[it.value()];
    }
    return std::nullopt;
}

std::optional<CatalogEntry> CatalogStore::lookupByAppFilename(const QString& filename) const
{
    const auto it = m_appFilenameIndex.constFind(filename.toLower());
    if (it == m_appFilenameIndex.constEnd()) {
        return std::nullopt;
    }
    return m_entries[it.value()];
}

std::optional<CatalogEntry> CatalogStore::matchProgram(const QString& name,
                                                       const std::optional<QString>& path) const
{
    if (auto entry = lookupByNameOrToken(name)) {
        return entry;
    }
    if (!path.has_value() || path->isEmpty()) {
        return std::nullopt;
    }

    const QFileInfo info(*path);
    if (auto entry = lookupByAppFilename(info.fileName())) {
        return entry;
    }
    return lookupByNameOrToken(info.completeBaseName());
}

} // namespace rb
