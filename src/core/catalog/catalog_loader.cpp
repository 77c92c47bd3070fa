#include "core/catalog/catalog_loader.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace rb {

namespace {

std::optional<QString> optionalString(const QJsonObject& json, const QString& key)
{
    const QJsonValue value = json.value(key);
    if (!value.isString()) {
        return std::nullopt;
    }
    return value.toString();
}

QStringList stringList(const QJsonValue& value)
{
    QStringList result;
    if (value.isString()) {
        result.append(value.toString());
        return result;
    }
    const QJsonArray array = value.toArray();
    result.reserve(array.size());
    for (const QJsonValue& item : array) {
        if (item.isString() && !item.toString().isEmpty()) {
            result.append(item.toString());
        }
    }
    return result;
}

} // namespace

std::optional<std::vector<CatalogEntry>> CatalogLoader::loadFile(const QString& path)
{
    QFile file(path);
    if (!file.exists()) {
        LOG_WARN(rbCatalog, "Catalog file does not exist: %s", qUtf8Printable(path));
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(rbCatalog, "Failed to open catalog file for read: %s", qUtf8Printable(path));
        return std::nullopt;
    }

    const QByteArray raw = file.readAll();
    file.close();

    auto entries = parse(raw);
    if (!entries.has_value()) {
        LOG_WARN(rbCatalog, "Catalog file is not a valid catalog document: %s",
                 qUtf8Printable(path));
        return std::nullopt;
    }

    LOG_INFO(rbCatalog, "Loaded %d catalog entries from %s",
             static_cast<int>(entries->size()), qUtf8Printable(path));
    return entries;
}

std::optional<std::vector<CatalogEntry>> CatalogLoader::parse(const QByteArray& json)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_WARN(rbCatalog, "Failed to parse catalog JSON: %s",
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    QJsonArray items;
    if (doc.isArray()) {
        items = doc.array();
    } else if (doc.isObject() && doc.object().value(QStringLiteral("data")).isArray()) {
        items = doc.object().value(QStringLiteral("data")).toArray();
    } else {
        return std::nullopt;
    }

    std::vector<CatalogEntry> entries;
    entries.reserve(static_cast<size_t>(items.size()));
    int skipped = 0;
    for (const QJsonValue& item : items) {
        auto entry = entryFromJson(item.toObject());
        if (!entry.has_value()) {
            ++skipped;
            continue;
        }
        entries.push_back(std::move(*entry));
    }

    if (skipped > 0) {
        LOG_DEBUG(rbCatalog, "Skipped %d malformed catalog entries", skipped);
    }
    return entries;
}

std::optional<CatalogEntry> CatalogLoader::entryFromJson(const QJsonObject& json)
{
    const QString token = json.value(QStringLiteral("token")).toString().trimmed();
    if (token.isEmpty()) {
        return std::nullopt;
    }

    CatalogEntry entry;
    entry.token = token;
    entry.fullToken = json.value(QStringLiteral("full_token")).toString(token);
    entry.names = stringList(json.value(QStringLiteral("name")));
    entry.description = optionalString(json, QStringLiteral("desc"));
    entry.homepage = optionalString(json, QStringLiteral("homepage"));
    entry.url = optionalString(json, QStringLiteral("url"));
    entry.version = optionalString(json, QStringLiteral("version"));
    entry.sha256 = optionalString(json, QStringLiteral("sha256"));
    entry.deprecated = json.value(QStringLiteral("deprecated")).toBool(false);

    const QJsonArray artifacts = json.value(QStringLiteral("artifacts")).toArray();
    for (const QJsonValue& artifact : artifacts) {
        if (!artifact.isObject()) {
            continue;
        }
        entry.appArtifacts.append(stringList(artifact.toObject().value(QStringLiteral("app"))));
    }

    return entry;
}

} // namespace rb
