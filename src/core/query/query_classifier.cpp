#include "core/query/query_classifier.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>

namespace rb {

namespace {

const QRegularExpression& schemeUrlPattern()
{
    static const QRegularExpression re(
        QStringLiteral("\\A[A-Za-z][A-Za-z0-9+.\\-]*://[^\\s/?#]+[^\\s]*\\z"));
    return re;
}

const QRegularExpression& hostUrlPattern()
{
    static const QRegularExpression re(
        QStringLiteral("\\A(?:[A-Za-z0-9](?:[A-Za-z0-9\\-]*[A-Za-z0-9])?\\.)+[A-Za-z]{2,}"
                       "(?::\\d{1,5})?(?:[/?#][^\\s]*)?\\z"));
    return re;
}

const QRegularExpression& schemePrefixPattern()
{
    static const QRegularExpression re(QStringLiteral("\\A[A-Za-z][A-Za-z0-9+.\\-]*:"));
    return re;
}

bool hasWhitespace(const QString& text)
{
    for (QChar ch : text) {
        if (ch.isSpace()) {
            return true;
        }
    }
    return false;
}

bool startsLikePath(const QString& text)
{
    return text.startsWith(QLatin1Char('/'))
        || text.startsWith(QLatin1Char('~'))
        || text.startsWith(QLatin1Char('.'));
}

FileSystemEntry entryFor(const QFileInfo& info)
{
    FileSystemEntry entry;
    entry.path = QDir::cleanPath(info.absoluteFilePath());
    entry.isDirectory = info.isDir();
    return entry;
}

} // namespace

std::vector<SearchResult> QueryClassification::results() const
{
    std::vector<SearchResult> out;
    switch (kind) {
    case Kind::None:
        break;
    case Kind::Url:
        out.emplace_back(UrlTarget{url});
        break;
    case Kind::Path:
        out.reserve(entries.size());
        for (const FileSystemEntry& entry : entries) {
            out.emplace_back(entry);
        }
        break;
    }
    return out;
}

QueryClassifier::QueryClassifier(QString baseDirectory, int listingLimit)
    : m_baseDirectory(baseDirectory.isEmpty() ? QDir::homePath() : std::move(baseDirectory))
    , m_listingLimit(listingLimit)
{
}

QueryClassification QueryClassifier::classify(const QString& input) const
{
    QueryClassification classification;
    const QString trimmed = input.trimmed();
    if (trimmed.isEmpty()) {
        return classification;
    }

    if (const auto url = resolveUrl(trimmed)) {
        classification.kind = QueryClassification::Kind::Url;
        classification.url = *url;
        return classification;
    }

    if (looksLikePath(trimmed)) {
        classification.entries = resolvePath(trimmed);
        if (!classification.entries.empty()) {
            classification.kind = QueryClassification::Kind::Path;
        }
    }
    return classification;
}

std::optional<QString> QueryClassifier::resolveUrl(const QString& trimmed)
{
    if (trimmed.isEmpty() || startsLikePath(trimmed)) {
        return std::nullopt;
    }

    if (schemeUrlPattern().match(trimmed).hasMatch()) {
        return trimmed;
    }
    if (hostUrlPattern().match(trimmed).hasMatch()) {
        return QStringLiteral("https://") + trimmed;
    }

    if (trimmed.contains(QLatin1Char('.')) && !hasWhitespace(trimmed)) {
        if (schemePrefixPattern().match(trimmed).hasMatch()) {
            return trimmed;
        }
        return QStringLiteral("https://") + trimmed;
    }
    return std::nullopt;
}

bool QueryClassifier::looksLikePath(const QString& trimmed)
{
    if (trimmed.isEmpty()) {
        return false;
    }
    if (!startsLikePath(trimmed) && !trimmed.contains(QLatin1Char('/'))) {
        return false;
    }
    return startsLikePath(trimmed) || !schemePrefixPattern().match(trimmed).hasMatch();
}

QString QueryClassifier::expandPath(const QString& trimmed) const
{
    QString path = trimmed;
    if (path == QLatin1String("~")) {
        path = QDir::homePath();
    } else if (path.startsWith(QLatin1String("~/"))) {
        path = QDir::homePath() + path.mid(1);
    }

    if (QDir::isRelativePath(path)) {
        path = QDir(m_baseDirectory).filePath(path);
    }
    return path;
}

std::vector<FileSystemEntry> QueryClassifier::resolvePath(const QString& trimmed) const
{
    const QString expanded = expandPath(trimmed);
    const QFileInfo info(expanded);

    if (info.exists()) {
        if (info.isDir()) {
            return listDirectory(info.absoluteFilePath(), QString());
        }
        return {entryFor(info)};
    }

    // A partially typed child of an existing directory filters its listing.
    if (expanded.endsWith(QLatin1Char('/'))) {
        return {};
    }
    const QFileInfo parent(info.absolutePath());
    if (!parent.exists() || !parent.isDir()) {
        return {};
    }
    return listDirectory(parent.absoluteFilePath(), info.fileName());
}

std::vector<FileSystemEntry> QueryClassifier::listDirectory(const QString& dirPath,
                                                            const QString& prefixFilter) const
{
    std::vector<FileSystemEntry> entries;
    const QDir dir(dirPath);
    if (!dir.isReadable()) {
        LOG_DEBUG(rbFs, "Directory not readable: %s", qUtf8Printable(dirPath));
        return entries;
    }

    const QFileInfoList children = dir.entryInfoList(
        QDir::AllEntries | QDir::Hidden | QDir::NoDotAndDotDot,
        QDir::DirsFirst | QDir::Name | QDir::IgnoreCase);

    for (const QFileInfo& child : children) {
        const QString name = child.fileName();
        if (name.startsWith(QLatin1Char('.')) && !prefixFilter.startsWith(QLatin1Char('.'))) {
            continue;
        }
        if (!prefixFilter.isEmpty() && !name.startsWith(prefixFilter, Qt::CaseInsensitive)) {
            continue;
        }
        entries.push_back(entryFor(child));
        if (m_listingLimit > 0 && static_cast<int>(entries.size()) >= m_listingLimit) {
            break;
        }
    }
    return entries;
}

} // namespace rb
