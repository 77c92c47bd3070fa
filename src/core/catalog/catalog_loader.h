#pragma once

#include "core/catalog/catalog_entry.h"

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include <optional>
#include <vector>

namespace rb {

// CatalogLoader -- reads the offline package catalog JSON.
//
// Accepts either {"data": [entry, ...]} or a bare array of entries. Entries
// without a token are skipped; artifacts that are not {"app": [...]} objects
// are ignored.
class CatalogLoader {
public:
    // Returns nullopt if the file is missing or is not a catalog document.
    static std::optional<std::vector<CatalogEntry>> loadFile(const QString& path);

    static std::optional<std::vector<CatalogEntry>> parse(const QByteArray& json);

    static std::optional<CatalogEntry> entryFromJson(const QJsonObject& json);
};

} // namespace rb
