#include "core/shared/search_result.h"

#include <QDir>
#include <QFileInfo>
#include <QJsonArray>

namespace rb {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

bool hasText(const std::optional<QString>& value)
{
    return value.has_value() && !value->isEmpty();
}

void insertOptional(QJsonObject& json, const QString& key, const std::optional<QString>& value)
{
    if (hasText(value)) {
        json.insert(key, *value);
    }
}

} // namespace

QString FileSystemEntry::displayName() const
{
    if (hasText(displayOverride)) {
        return *displayOverride;
    }

    QString name = QFileInfo(path).fileName();
    if (name.isEmpty()) {
        name = path;
    }
    if (isDirectory && !name.endsWith(QLatin1Char('/'))) {
        name.append(QLatin1Char('/'));
    }
    return name;
}

QString resultKindToString(ResultKind kind)
{
    switch (kind) {
    case ResultKind::InstalledProgram: return QStringLiteral("installed");
    case ResultKind::CatalogEntry:     return QStringLiteral("catalog");
    case ResultKind::HistoryCommand:   return QStringLiteral("history");
    case ResultKind::Url:              return QStringLiteral("url");
    case ResultKind::FileSystemEntry:  return QStringLiteral("filesystem");
    }
    return QStringLiteral("unknown");
}

QString searchSourceToString(SearchSource source)
{
    switch (source) {
    case SearchSource::InstalledPrograms: return QStringLiteral("installed");
    case SearchSource::Catalog:           return QStringLiteral("catalog");
    case SearchSource::CommandHistory:    return QStringLiteral("history");
    }
    return QStringLiteral("unknown");
}

ResultKind SearchResult::kind() const
{
    return std::visit(Overloaded{
        [](const InstalledProgram&) { return ResultKind::InstalledProgram; },
        [](const CatalogEntry&)     { return ResultKind::CatalogEntry; },
        [](const HistoryCommand&)   { return ResultKind::HistoryCommand; },
        [](const UrlTarget&)        { return ResultKind::Url; },
        [](const FileSystemEntry&)  { return ResultKind::FileSystemEntry; },
    }, m_value);
}

QString SearchResult::displayName() const
{
    return std::visit(Overloaded{
        [](const InstalledProgram& p) { return p.name; },
        [](const CatalogEntry& c)     { return c.displayName(); },
        [](const HistoryCommand& h)   { return hasText(h.display) ? *h.display : h.command; },
        [](const UrlTarget& u)        { return u.url; },
        [](const FileSystemEntry& f)  { return f.displayName(); },
    }, m_value);
}

QString SearchResult::identityKey() const
{
    return std::visit(Overloaded{
        [](const InstalledProgram& p) {
            if (hasText(p.bundleId)) {
                return p.bundleId->toLower();
            }
            if (hasText(p.path)) {
                return p.path->toLower();
            }
            return p.name.toLower();
        },
        [](const CatalogEntry& c)    { return c.displayName().toLower(); },
        [](const HistoryCommand& h)  { return h.command.toLower(); },
        [](const UrlTarget& u)       { return u.url.toLower(); },
        [](const FileSystemEntry& f) {
            return QDir::cleanPath(QFileInfo(f.path).absoluteFilePath()).toLower();
        },
    }, m_value);
}

QJsonObject SearchResult::toJson() const
{
    QJsonObject json;
    json.insert(QStringLiteral("kind"), resultKindToString(kind()));
    json.insert(QStringLiteral("displayName"), displayName());
    json.insert(QStringLiteral("identity"), identityKey());

    std::visit(Overloaded{
        [&json](const InstalledProgram& p) {
            insertOptional(json, QStringLiteral("path"), p.path);
            insertOptional(json, QStringLiteral("bundleId"), p.bundleId);
            insertOptional(json, QStringLiteral("description"), p.description);
            if (p.catalogEntry.has_value()) {
                json.insert(QStringLiteral("catalogToken"), p.catalogEntry->token);
            }
        },
        [&json](const CatalogEntry& c) {
            json.insert(QStringLiteral("token"), c.token);
            json.insert(QStringLiteral("fullToken"), c.fullToken);
            insertOptional(json, QStringLiteral("description"), c.description);
            insertOptional(json, QStringLiteral("homepage"), c.homepage);
            insertOptional(json, QStringLiteral("version"), c.version);
            json.insert(QStringLiteral("deprecated"), c.deprecated);
            json.insert(QStringLiteral("apps"), QJsonArray::fromStringList(c.appArtifacts));
        },
        [&json](const HistoryCommand& h) {
            json.insert(QStringLiteral("command"), h.command);
            insertOptional(json, QStringLiteral("subtitle"), h.subtitle);
            json.insert(QStringLiteral("isRecent"), h.isRecent);
            if (h.target.has_value()) {
                json.insert(QStringLiteral("target"), h.target->toJson());
            }
            if (h.resolvedTarget) {
                json.insert(QStringLiteral("resolved"), h.resolvedTarget->toJson());
            }
        },
        [&json](const UrlTarget& u) {
            json.insert(QStringLiteral("url"), u.url);
        },
        [&json](const FileSystemEntry& f) {
            json.insert(QStringLiteral("path"), f.path);
            json.insert(QStringLiteral("isDirectory"), f.isDirectory);
        },
    }, m_value);

    return json;
}

} // namespace rb
