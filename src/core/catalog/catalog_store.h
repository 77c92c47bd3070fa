#pragma once

#include "core/catalog/catalog_entry.h"

#include <QHash>
#include <QString>

#include <optional>
#include <vector>

namespace rb {

// CatalogStore: immutable, in-memory package catalog.
//
// Built once at startup and shared read-only by every provider, so lookups
// need no locking. Three case-insensitive indices are kept:
//   - display name (every entry of names[])
//   - token
//   - provided program filename (artifacts[].app[])
// On collisions the entry appearing later in the catalog wins.
class CatalogStore {
public:
    CatalogStore() = default;
    explicit CatalogStore(std::vector<CatalogEntry> entries);

    const std::vector<CatalogEntry>& entries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.empty(); }

    // Name index first, then token index.
    std::optional<CatalogEntry> lookupByNameOrToken(const QString& raw) const;

    // Looks up the package that installs e.g. "Visual Studio Code.app".
    std::optional<CatalogEntry> lookupByAppFilename(const QString& filename) const;

    // Finds the package that provides an installed program: by program name,
    // then by the program file's name, then by that name without extension.
    std::optional<CatalogEntry> matchProgram(const QString& name,
                                             const std::optional<QString>& path) const;

private:
    std::vector<CatalogEntry> m_entries;
    QHash<QString, size_t> m_nameIndex;
    QHash<QString, size_t> m_tokenIndex;
    QHash<QString, size_t> m_appFilenameIndex;
};

} // namespace rb
