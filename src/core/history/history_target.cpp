#include "core/history/history_target.h"
#include "core/shared/search_result.h"

namespace rb {

QString historyTargetKindToString(HistoryTarget::Kind kind)
{
    switch (kind) {
    case HistoryTarget::Kind::InstalledProgram: return QStringLiteral("installed");
    case HistoryTarget::Kind::CatalogEntry:     return QStringLiteral("catalog");
    case HistoryTarget::Kind::Url:              return QStringLiteral("url");
    case HistoryTarget::Kind::FileSystemEntry:  return QStringLiteral("filesystem");
    }
    return QStringLiteral("unknown");
}

std::optional<HistoryTarget::Kind> historyTargetKindFromString(const QString& str)
{
    if (str == QLatin1String("installed")) {
        return HistoryTarget::Kind::InstalledProgram;
    }
    if (str == QLatin1String("catalog")) {
        return HistoryTarget::Kind::CatalogEntry;
    }
    if (str == QLatin1String("url")) {
        return HistoryTarget::Kind::Url;
    }
    if (str == QLatin1String("filesystem")) {
        return HistoryTarget::Kind::FileSystemEntry;
    }
    return std::nullopt;
}

std::optional<HistoryTarget> HistoryTarget::fromResult(const SearchResult& result)
{
    HistoryTarget target;

    switch (result.kind()) {
    case ResultKind::InstalledProgram: {
        const InstalledProgram* program = result.as<InstalledProgram>();
        if (!program->path.has_value() || program->path->isEmpty()) {
            return std::nullopt;
        }
        target.kind = Kind::InstalledProgram;
        target.ref = *program->path;
        target.name = program->name;
        target.bundleId = program->bundleId;
        return target;
    }
    case ResultKind::CatalogEntry:
        target.kind = Kind::CatalogEntry;
        target.ref = result.as<CatalogEntry>()->token;
        return target;
    case ResultKind::HistoryCommand: {
        const HistoryCommand* command = result.as<HistoryCommand>();
        if (command->resolvedTarget) {
            return fromResult(*command->resolvedTarget);
        }
        return command->target;
    }
    case ResultKind::Url:
        target.kind = Kind::Url;
        target.ref = result.as<UrlTarget>()->url;
        return target;
    case ResultKind::FileSystemEntry:
        target.kind = Kind::FileSystemEntry;
        target.ref = result.as<FileSystemEntry>()->path;
        return target;
    }

    return std::nullopt;
}

QJsonObject HistoryTarget::toJson() const
{
    QJsonObject json;
    json.insert(QStringLiteral("kind"), historyTargetKindToString(kind));
    json.insert(QStringLiteral("ref"), ref);
    if (name.has_value()) {
        json.insert(QStringLiteral("name"), *name);
    }
    if (bundleId.has_value()) {
        json.insert(QStringLiteral("bundleId"), *bundleId);
    }
    return json;
}

std::optional<HistoryTarget> HistoryTarget::fromJson(const QJsonObject& json)
{
    const auto kind = historyTargetKindFromString(json.value(QStringLiteral("kind")).toString());
    const QString ref = json.value(QStringLiteral("ref")).toString();
    if (!kind.has_value() || ref.isEmpty()) {
        return std::nullopt;
    }

    HistoryTarget target;
    target.kind = *kind;
    target.ref = ref;
    if (json.value(QStringLiteral("name")).isString()) {
        target.name = json.value(QStringLiteral("name")).toString();
    }
    if (json.value(QStringLiteral("bundleId")).isString()) {
        target.bundleId = json.value(QStringLiteral("bundleId")).toString();
    }
    return target;
}

bool HistoryTarget::operator==(const HistoryTarget& other) const
{
    return kind == other.kind
        && ref == other.ref
        && name == other.name
        && bundleId == other.bundleId;
}

} // namespace rb
