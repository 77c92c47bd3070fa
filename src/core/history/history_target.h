#pragma once

#include <QJsonObject>
#include <QString>

#include <optional>

namespace rb {

class SearchResult;

// Reference from a history entry to the concrete result it originally
// launched. Re-resolved on every query; never a cached copy of the result.
struct HistoryTarget {
    enum class Kind {
        InstalledProgram,
        CatalogEntry,
        Url,
        FileSystemEntry,
    };

    Kind kind = Kind::InstalledProgram;
    QString ref;                      // path, catalog token, URL or filesystem path
    std::optional<QString> name;      // installed program display name
    std::optional<QString> bundleId;  // installed program bundle identifier

    // Builds the reference for a result the user just launched. History
    // entries resolve to their own target; returns nullopt when a result has
    // nothing stable to point back at.
    static std::optional<HistoryTarget> fromResult(const SearchResult& result);

    QJsonObject toJson() const;
    static std::optional<HistoryTarget> fromJson(const QJsonObject& json);

    bool operator==(const HistoryTarget& other) const;
};

QString historyTargetKindToString(HistoryTarget::Kind kind);
std::optional<HistoryTarget::Kind> historyTargetKindFromString(const QString& str);

} // namespace rb
