#pragma once

#include <QString>
#include <QStringList>

#include <optional>

namespace rb {

// One package of the offline catalog. Field names follow the catalog JSON
// document (token, full_token, name[], desc, homepage, url, version, sha256,
// deprecated, artifacts[].app[]).
struct CatalogEntry {
    QString token;
    QString fullToken;
    QStringList names;
    std::optional<QString> description;
    std::optional<QString> homepage;
    std::optional<QString> url;
    std::optional<QString> version;
    std::optional<QString> sha256;
    bool deprecated = false;

    // Program bundle filenames the package installs, e.g. "Visual Studio Code.app".
    QStringList appArtifacts;

    // First display name, or the token when the entry has no names.
    QString displayName() const;

    bool operator==(const CatalogEntry& other) const;
};

} // namespace rb
