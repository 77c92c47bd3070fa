#include "core/programs/desktop_entry_index.h"
#include "core/query/fuzzy_helper.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QSet>
#include <QStandardPaths>
#include <QTextStream>

#include <algorithm>

namespace rb {

namespace {

bool isTrue(const QString& value)
{
    return value.trimmed().compare(QLatin1String("true"), Qt::CaseInsensitive) == 0;
}

} // namespace

DesktopEntryIndex::DesktopEntryIndex(QStringList directories)
    : m_directories(std::move(directories))
{
    if (m_directories.isEmpty()) {
        m_directories = QStandardPaths::standardLocations(QStandardPaths::ApplicationsLocation);
    }
}

void DesktopEntryIndex::refresh()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_scanned = false;
    m_records.clear();
}

std::optional<std::vector<ProgramRecord>> DesktopEntryIndex::query(const QString& wildcard,
                                                                   int limit)
{
    const QRegularExpression re = FuzzyHelper::wildcardToRegularExpression(wildcard);
    if (!re.isValid()) {
        LOG_WARN(rbPrograms, "Invalid program query '%s': %s",
                 qUtf8Printable(wildcard), qUtf8Printable(re.errorString()));
        return std::nullopt;
    }

    std::vector<ProgramRecord> matches;
    if (limit <= 0) {
        return matches;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    ensureScannedLocked();

    for (const ProgramRecord& record : m_records) {
        if (!re.match(record.name).hasMatch()) {
            continue;
        }
        matches.push_back(record);
        if (static_cast<int>(matches.size()) >= limit) {
            break;
        }
    }
    return matches;
}

void DesktopEntryIndex::ensureScannedLocked()
{
    if (m_scanned) {
        return;
    }

    QSet<QString> seenIds;
    int fileCount = 0;

    for (const QString& root : m_directories) {
        const QDir rootDir(root);
        if (!rootDir.exists()) {
            continue;
        }

        QDirIterator it(root, {QStringLiteral("*.desktop")}, QDir::Files,
                        QDirIterator::Subdirectories | QDirIterator::FollowSymlinks);
        while (it.hasNext()) {
            const QString filePath = it.next();
            ++fileCount;

            // Desktop file id: path relative to the applications dir, '/' -> '-'.
            QString desktopId = rootDir.relativeFilePath(filePath);
            desktopId.replace(QLatin1Char('/'), QLatin1Char('-'));
            if (seenIds.contains(desktopId)) {
                continue;
            }
            seenIds.insert(desktopId);

            auto record = parseDesktopFile(filePath, desktopId);
            if (record.has_value()) {
                m_records.push_back(std::move(*record));
            }
        }
    }

    std::stable_sort(m_records.begin(), m_records.end(),
                     [](const ProgramRecord& a, const ProgramRecord& b) {
                         return a.name.compare(b.name, Qt::CaseInsensitive) < 0;
                     });

    m_scanned = true;
    LOG_INFO(rbPrograms, "Scanned %d desktop files, %d applications",
             fileCount, static_cast<int>(m_records.size()));
}

std::optional<ProgramRecord> DesktopEntryIndex::parseDesktopFile(const QString& filePath,
                                                                 const QString& desktopId)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_DEBUG(rbPrograms, "Cannot read %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    QString name;
    QString comment;
    QString type;
    bool hidden = false;

    bool inMainGroup = false;
    QTextStream in(&file);
    while (!in.atEnd()) {
        const QString line = in.readLine().trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) {
            continue;
        }
        if (line.startsWith(QLatin1Char('['))) {
            inMainGroup = (line == QLatin1String("[Desktop Entry]"));
            continue;
        }
        if (!inMainGroup) {
            continue;
        }

        const int eq = line.indexOf(QLatin1Char('='));
        if (eq <= 0) {
            continue;
        }
        const QString key = line.left(eq).trimmed();
        const QString value = line.mid(eq + 1).trimmed();

        // Localized keys (Name[de]) are ignored.
        if (key == QLatin1String("Name")) {
            name = value;
        } else if (key == QLatin1String("Comment")) {
            comment = value;
        } else if (key == QLatin1String("Type")) {
            type = value;
        } else if (key == QLatin1String("NoDisplay") || key == QLatin1String("Hidden")) {
            hidden = hidden || isTrue(value);
        }
    }

    if (type != QLatin1String("Application") || hidden || name.isEmpty()) {
        return std::nullopt;
    }

    ProgramRecord record;
    record.name = name;
    record.path = QFileInfo(filePath).absoluteFilePath();
    record.bundleId = desktopId;
    if (!comment.isEmpty()) {
        record.description = comment;
    }
    return record;
}

} // namespace rb
