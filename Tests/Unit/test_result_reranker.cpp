#include <QtTest/QtTest>
#include "core/search/result_reranker.h"
#include "search_test_fakes.h"

using rb::test::makePackage;

namespace {

rb::ProviderResult installed(const QString& name, const QString& path, int score,
                             const std::optional<QString>& bundleId = std::nullopt)
{
    rb::InstalledProgram program;
    program.name = name;
    program.path = path;
    program.bundleId = bundleId;
    return {rb::SearchSource::InstalledPrograms, rb::SearchResult(std::move(program)), score};
}

rb::ProviderResult history(const QString& command, int score,
                           const std::optional<QString>& display = std::nullopt)
{
    rb::HistoryCommand row;
    row.command = command;
    row.display = display;
    return {rb::SearchSource::CommandHistory, rb::SearchResult(std::move(row)), score};
}

rb::ProviderResult package(const rb::CatalogEntry& entry, int score)
{
    return {rb::SearchSource::Catalog, rb::SearchResult(entry), score};
}

QStringList names(const std::vector<rb::RankedResult>& ranked)
{
    QStringList out;
    for (const rb::RankedResult& r : ranked) {
        out.append(r.result.displayName());
    }
    return out;
}

} // namespace

class TestResultReranker : public QObject {
    Q_OBJECT

private slots:
    void testPriorityTiers()
    {
        const rb::SearchQuery query(QStringLiteral("Code"));
        using R = rb::ResultReranker;

        QCOMPARE(R::priority(installed(QStringLiteral("code"), {}, 0).result, query),
                 R::kInstalledExactTier);
        QCOMPARE(R::priority(installed(QStringLiteral("Codex"), {}, 0).result, query),
                 R::kPrimaryTier);
        QCOMPARE(R::priority(history(QStringLiteral("CODE"), 0).result, query),
                 R::kHistoryExactTier);
        QCOMPARE(R::priority(history(QStringLiteral("code ."), 0).result, query),
                 R::kPrimaryTier);

        const auto byToken = makePackage(QStringLiteral("code"), {QStringLiteral("Visual Studio Code")});
        QCOMPARE(R::priority(rb::SearchResult(byToken), query), R::kPrimaryTier);
        const auto partial = makePackage(QStringLiteral("code-insiders"), {QStringLiteral("Code Insiders")});
        QCOMPARE(R::priority(rb::SearchResult(partial), query), R::kSecondaryTier);

        QCOMPARE(R::priority(rb::SearchResult(rb::UrlTarget{QStringLiteral("https://code")}), query),
                 R::kSecondaryTier);
    }

    void testTierBeatsScore()
    {
        const rb::SearchQuery query(QStringLiteral("code"));
        const std::vector<rb::ProviderResult> input = {
            package(makePackage(QStringLiteral("codepoint"), {QStringLiteral("CodePoint")}), 900),
            history(QStringLiteral("code"), 1000, QStringLiteral("Run code")),
            installed(QStringLiteral("Code"), QStringLiteral("/apps/code.desktop"), 1000),
            installed(QStringLiteral("Xcode Helper"), QStringLiteral("/apps/xcode.desktop"), 100),
        };

        const auto ranked = rb::ResultReranker::rerank(input, query);
        QCOMPARE(names(ranked), QStringList({QStringLiteral("Code"), QStringLiteral("Run code"),
                                             QStringLiteral("Xcode Helper"),
                                             QStringLiteral("CodePoint")}));
        QCOMPARE(ranked[0].tier, rb::ResultReranker::kInstalledExactTier);
        QCOMPARE(ranked[1].tier, rb::ResultReranker::kHistoryExactTier);
        QCOMPARE(ranked[3].tier, rb::ResultReranker::kSecondaryTier);
    }

    void testTiesBreakByScoreThenName()
    {
        const rb::SearchQuery query(QStringLiteral("a"));
        const std::vector<rb::ProviderResult> input = {
            installed(QStringLiteral("beta app"), QStringLiteral("/apps/beta"), 800),
            installed(QStringLiteral("Alpha app"), QStringLiteral("/apps/alpha"), 800),
            installed(QStringLiteral("gamma app"), QStringLiteral("/apps/gamma"), 900),
        };

        const auto ranked = rb::ResultReranker::rerank(input, query);
        QCOMPARE(names(ranked), QStringList({QStringLiteral("gamma app"),
                                             QStringLiteral("Alpha app"),
                                             QStringLiteral("beta app")}));
    }

    void testHistoryFoldsIntoInstalledProgram()
    {
        const rb::SearchQuery query(QStringLiteral("fire"));
        const std::vector<rb::ProviderResult> input = {
            history(QStringLiteral("fire"), 540, QStringLiteral("Firefox")),
            installed(QStringLiteral("Firefox"), QStringLiteral("/apps/firefox.desktop"), 900),
        };

        const auto ranked = rb::ResultReranker::rerank(input, query);
        QCOMPARE(static_cast<int>(ranked.size()), 1);
        QVERIFY(ranked[0].result.isInstalled());
        QCOMPARE(ranked[0].score, 1440);
    }

    void testHistoryWithoutDisplayNameDoesNotFold()
    {
        const rb::SearchQuery query(QStringLiteral("slack"));
        const std::vector<rb::ProviderResult> input = {
            history(QStringLiteral("slack"), 1000),
            installed(QStringLiteral("Slack"), QStringLiteral("/apps/slack.desktop"), 1000),
        };

        const auto ranked = rb::ResultReranker::rerank(input, query);
        QCOMPARE(static_cast<int>(ranked.size()), 2);
        QVERIFY(ranked[0].result.isInstalled());
        QCOMPARE(ranked[0].score, 1000);
        QCOMPARE(ranked[1].result.kind(), rb::ResultKind::HistoryCommand);
        QCOMPARE(ranked[1].result.as<rb::HistoryCommand>()->command, QStringLiteral("slack"));
    }

    void testDesktopEntrySuppressesCatalogPackage()
    {
        const rb::SearchQuery query(QStringLiteral("code"));
        const std::vector<rb::ProviderResult> byName = {
            package(makePackage(QStringLiteral("visual-studio-code"), {QStringLiteral("VS Code Package")},
                                {QStringLiteral("Visual Studio Code.app")}), 900),
            installed(QStringLiteral("Visual Studio Code"),
                      QStringLiteral("/usr/share/applications/code.desktop"), 950),
        };
        QCOMPARE(names(rb::ResultReranker::rerank(byName, query)),
                 QStringList({QStringLiteral("Visual Studio Code")}));

        const std::vector<rb::ProviderResult> byStem = {
            package(makePackage(QStringLiteral("firefox"), {QStringLiteral("Firefox Package")},
                                {QStringLiteral("firefox.app")}), 900),
            installed(QStringLiteral("Web Browser"),
                      QStringLiteral("/usr/share/applications/firefox.desktop"), 100),
        };
        QCOMPARE(names(rb::ResultReranker::rerank(byStem, query)),
                 QStringList({QStringLiteral("Web Browser")}));

        const std::vector<rb::ProviderResult> unrelated = {
            package(makePackage(QStringLiteral("code-insiders"), {QStringLiteral("Code Insiders")},
                                {QStringLiteral("Code Insiders.app")}), 900),
            installed(QStringLiteral("Visual Studio Code"),
                      QStringLiteral("/usr/share/applications/code.desktop"), 950),
        };
        QCOMPARE(static_cast<int>(rb::ResultReranker::rerank(unrelated, query).size()), 2);
    }

    void testInstalledPackageIsNotOfferedFromCatalog()
    {
        const rb::SearchQuery query(QStringLiteral("visual"));
        const std::vector<rb::ProviderResult> input = {
            package(makePackage(QStringLiteral("visual-studio-code"), {QStringLiteral("VS Code Package")},
                                {QStringLiteral("Visual Studio Code.app")}), 900),
            installed(QStringLiteral("Visual Studio Code"),
                      QStringLiteral("/Applications/Visual Studio Code.app"), 900),
        };

        const auto ranked = rb::ResultReranker::rerank(input, query);
        QCOMPARE(names(ranked), QStringList({QStringLiteral("Visual Studio Code")}));
    }

    void testDisplayNameDedupExemptsHistory()
    {
        const rb::SearchQuery query(QStringLiteral("slack"));
        const std::vector<rb::ProviderResult> input = {
            package(makePackage(QStringLiteral("slack"), {QStringLiteral("Slack")}), 1000),
            history(QStringLiteral("slk"), 400, QStringLiteral("Slack")),
        };

        const auto ranked = rb::ResultReranker::rerank(input, query);
        QCOMPARE(static_cast<int>(ranked.size()), 2);
        QCOMPARE(ranked[0].result.kind(), rb::ResultKind::CatalogEntry);
        QCOMPARE(ranked[1].result.kind(), rb::ResultKind::HistoryCommand);

        const std::vector<rb::ProviderResult> withProgram = {
            installed(QStringLiteral("Slack"), QStringLiteral("/opt/slack.desktop"), 1000),
            package(makePackage(QStringLiteral("slack-beta"), {QStringLiteral("Slack")}), 1000),
        };
        const auto deduped = rb::ResultReranker::rerank(withProgram, query);
        QCOMPARE(static_cast<int>(deduped.size()), 1);
        QVERIFY(deduped[0].result.isInstalled());
    }

    void testIdentityDedupKeepsBestRanked()
    {
        const rb::SearchQuery query(QStringLiteral("term"));
        const std::vector<rb::ProviderResult> input = {
            installed(QStringLiteral("Terminal"), QStringLiteral("/a/terminal.desktop"), 900,
                      QStringLiteral("org.terminal")),
            installed(QStringLiteral("Terminal (legacy)"), QStringLiteral("/b/terminal.desktop"), 950,
                      QStringLiteral("ORG.TERMINAL")),
        };

        const auto ranked = rb::ResultReranker::rerank(input, query);
        QCOMPARE(names(ranked), QStringList({QStringLiteral("Terminal (legacy)")}));
    }

    void testEmptyInput()
    {
        QVERIFY(rb::ResultReranker::rerank({}, rb::SearchQuery(QStringLiteral("x"))).empty());
    }
};

QTEST_MAIN(TestResultReranker)
#include "test_result_reranker.moc"
