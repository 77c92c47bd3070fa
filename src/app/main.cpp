#include "launcher_runtime.h"
#include "search_controller.h"
#include "core/history/command_history.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>
#include <QTimer>

#include <cstdio>

namespace {

constexpr int kDeliveryGuardMs = 10000;

// Runs one query through the controller and waits for its delivery.
QJsonArray runQuery(rb::SearchController& controller, const QString& text)
{
    if (controller.query() != text) {
        QEventLoop loop;
        QObject::connect(&controller, &rb::SearchController::resultsDelivered,
                         &loop, &QEventLoop::quit);
        QTimer::singleShot(kDeliveryGuardMs, &loop, &QEventLoop::quit);
        controller.setQuery(text);
        loop.exec();
    }
    return QJsonArray::fromVariantList(controller.resultRows());
}

void printJson(const QJsonArray& rows)
{
    QTextStream out(stdout);
    out << QJsonDocument(rows).toJson(QJsonDocument::Indented);
    out.flush();
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("runbar-query"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Query the Runbar launcher index. Without options, reads one query per line from stdin."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption queryOption(QStringLiteral("query"),
        QStringLiteral("Run a single query and print the results as JSON."), QStringLiteral("text"));
    const QCommandLineOption recordOption(QStringLiteral("record"),
        QStringLiteral("Record a successfully run command."), QStringLiteral("command"));
    const QCommandLineOption displayOption(QStringLiteral("display"),
        QStringLiteral("Display name for --record."), QStringLiteral("name"));
    const QCommandLineOption subtitleOption(QStringLiteral("subtitle"),
        QStringLiteral("Subtitle for --record."), QStringLiteral("text"));
    const QCommandLineOption forgetOption(QStringLiteral("forget"),
        QStringLiteral("Remove a command from history."), QStringLiteral("command"));
    const QCommandLineOption recentOption(QStringLiteral("recent"),
        QStringLiteral("Print the most recent commands."));
    const QCommandLineOption settingsOption(QStringLiteral("settings"),
        QStringLiteral("Settings file to use."), QStringLiteral("path"));
    const QCommandLineOption scoresOption(QStringLiteral("scores"),
        QStringLiteral("Include final ranking scores in the output."));

    parser.addOptions({queryOption, recordOption, displayOption, subtitleOption,
                       forgetOption, recentOption, settingsOption, scoresOption});
    parser.process(app);

    const QString settingsPath = parser.isSet(settingsOption)
        ? parser.value(settingsOption)
        : rb::SettingsManager::settingsFilePath();
    const rb::Settings settings = rb::SettingsManager::load(settingsPath).value_or(rb::Settings{});

    rb::LauncherRuntime runtime(settings);
    runtime.initialize();

    if (parser.isSet(recordOption)) {
        std::optional<QString> display;
        std::optional<QString> subtitle;
        if (parser.isSet(displayOption)) {
            display = parser.value(displayOption);
        }
        if (parser.isSet(subtitleOption)) {
            subtitle = parser.value(subtitleOption);
        }
        return runtime.history()->record(parser.value(recordOption), display, subtitle) ? 0 : 1;
    }

    if (parser.isSet(forgetOption)) {
        if (!runtime.history()->remove(parser.value(forgetOption))) {
            LOG_WARN(rbHistory, "No history entry for '%s'",
                     qUtf8Printable(parser.value(forgetOption)));
            return 1;
        }
        return 0;
    }

    rb::SearchController controller(runtime.conductor(), runtime.history(), runtime.classifier());
    controller.setDebounceInterval(runtime.settings().debounceMs);
    if (parser.isSet(scoresOption)) {
        controller.setScoreRecorder(runtime.scoreRecorder());
    }

    if (parser.isSet(recentOption)) {
        // The controller starts with an empty query; force a delivery.
        controller.setQuery(QStringLiteral(" "));
        printJson(runQuery(controller, QString()));
        return 0;
    }

    if (parser.isSet(queryOption)) {
        printJson(runQuery(controller, parser.value(queryOption)));
        return 0;
    }

    QTextStream in(stdin);
    QString line;
    while (in.readLineInto(&line)) {
        printJson(runQuery(controller, line));
    }
    return 0;
}
