#include "result_presentation.h"
#include "core/search/debug_score_recorder.h"

#include <QDir>

namespace rb {

namespace {

const SearchResult* presentedTarget(const SearchResult& result)
{
    if (const auto* history = result.as<HistoryCommand>()) {
        return history->resolvedTarget.get();
    }
    return nullptr;
}

std::optional<QString> installedSubtitle(const InstalledProgram& program)
{
    std::optional<QString> path = ResultPresentation::sanitized(program.path);
    if (path.has_value()) {
        path = ResultPresentation::abbreviateHome(*path);
    }
    const std::optional<QString> description = ResultPresentation::sanitized(program.description);

    if (path.has_value() && description.has_value()) {
        return *path + QStringLiteral(" - ") + *description;
    }
    if (path.has_value()) {
        return path;
    }
    return description;
}

std::optional<QString> packageSubtitle(const CatalogEntry& entry)
{
    if (auto description = ResultPresentation::sanitized(entry.description)) {
        return description;
    }
    return ResultPresentation::sanitized(entry.homepage);
}

} // namespace

std::optional<QString> ResultPresentation::sanitized(const std::optional<QString>& text)
{
    if (!text.has_value()) {
        return std::nullopt;
    }
    QString trimmed = text->trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }
    trimmed.replace(QLatin1Char('\n'), QLatin1Char(' '));
    return trimmed;
}

QString ResultPresentation::abbreviateHome(const QString& text)
{
    const QString home = QDir::homePath();
    if (home.isEmpty() || home == QLatin1String("/")) {
        return text;
    }
    QString out = text;
    out.replace(home, QStringLiteral("~"));
    return out;
}

QString ResultPresentation::title(const SearchResult& result)
{
    if (const SearchResult* target = presentedTarget(result)) {
        return title(*target);
    }

    if (const auto* history = result.as<HistoryCommand>()) {
        const auto display = sanitized(history->display);
        return abbreviateHome(display.has_value() ? *display : history->command.trimmed());
    }
    return result.displayName();
}

std::optional<QString> ResultPresentation::subtitle(const SearchResult& result)
{
    if (const SearchResult* target = presentedTarget(result)) {
        return subtitle(*target);
    }

    switch (result.kind()) {
    case ResultKind::InstalledProgram:
        return installedSubtitle(*result.as<InstalledProgram>());
    case ResultKind::CatalogEntry:
        return packageSubtitle(*result.as<CatalogEntry>());
    case ResultKind::HistoryCommand: {
        const HistoryCommand* history = result.as<HistoryCommand>();
        if (auto stored = sanitized(history->subtitle)) {
            return abbreviateHome(*stored);
        }
        // Show the command under a custom display name.
        const auto display = sanitized(history->display);
        const QString command = history->command.trimmed();
        if (display.has_value() && !command.isEmpty()
            && display->compare(command, Qt::CaseInsensitive) != 0) {
            return abbreviateHome(command);
        }
        return std::nullopt;
    }
    case ResultKind::Url:
        return QStringLiteral("Opens in default browser");
    case ResultKind::FileSystemEntry:
        return QStringLiteral("Opens in file manager");
    }
    return std::nullopt;
}

QString ResultPresentation::actionHint(const SearchResult& result)
{
    if (const SearchResult* target = presentedTarget(result)) {
        return actionHint(*target);
    }

    switch (result.kind()) {
    case ResultKind::CatalogEntry:
        return QStringLiteral("Homepage");
    case ResultKind::FileSystemEntry:
        return result.as<FileSystemEntry>()->isDirectory ? QStringLiteral("Activate")
                                                         : QStringLiteral("Open");
    case ResultKind::InstalledProgram:
    case ResultKind::HistoryCommand:
    case ResultKind::Url:
        return QStringLiteral("Open");
    }
    return QStringLiteral("Open");
}

int ResultPresentation::rowHeight(const SearchResult& result)
{
    return subtitle(result).has_value() ? kSubtitleRowHeight : kTitleOnlyRowHeight;
}

QVariantMap ResultPresentation::toRow(const SearchResult& result, const DebugScoreRecorder* scores)
{
    QVariantMap row;
    row.insert(QStringLiteral("title"), title(result));
    const auto sub = subtitle(result);
    row.insert(QStringLiteral("subtitle"), sub.has_value() ? *sub : QString());
    row.insert(QStringLiteral("kind"), resultKindToString(result.kind()));
    row.insert(QStringLiteral("identity"), result.identityKey());
    row.insert(QStringLiteral("actionHint"), actionHint(result));
    row.insert(QStringLiteral("rowHeight"), rowHeight(result));

    const auto* history = result.as<HistoryCommand>();
    row.insert(QStringLiteral("isRecent"), history != nullptr && history->isRecent);

    if (scores) {
        if (const auto score = scores->score(result)) {
            row.insert(QStringLiteral("score"), *score);
        }
    }
    return row;
}

} // namespace rb
