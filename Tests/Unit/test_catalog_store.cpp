#include <QtTest/QtTest>
#include "core/catalog/catalog_loader.h"
#include "core/catalog/catalog_store.h"
#include "search_test_fakes.h"

#include <QTemporaryDir>

using rb::test::makePackage;

class TestCatalogStore : public QObject {
    Q_OBJECT

private slots:
    void testParseDataEnvelope();
    void testParseBareArray();
    void testParseRejectsNonCatalogDocuments();
    void testEntryDefaultsAndSkips();
    void testLoadFile();
    void testLookupByNameOrToken();
    void testLookupByAppFilename();
    void testLaterEntryWinsCollisions();
    void testMatchProgram();
};

void TestCatalogStore::testParseDataEnvelope()
{
    const QByteArray json = R"({"data": [
        {"token": "visual-studio-code", "full_token": "homebrew/cask/visual-studio-code",
         "name": ["Visual Studio Code", "VS Code"], "desc": "Code editor",
         "homepage": "https://code.visualstudio.com/", "version": "1.90.0",
         "deprecated": false,
         "artifacts": [{"app": ["Visual Studio Code.app"]}, {"binary": ["code"]}, "junk"]}
    ]})";

    const auto entries = rb::CatalogLoader::parse(json);
    QVERIFY(entries.has_value());
    QCOMPARE(static_cast<int>(entries->size()), 1);

    const rb::CatalogEntry& entry = entries->front();
    QCOMPARE(entry.token, QStringLiteral("visual-studio-code"));
    QCOMPARE(entry.fullToken, QStringLiteral("homebrew/cask/visual-studio-code"));
    QCOMPARE(entry.names, QStringList({QStringLiteral("Visual Studio Code"), QStringLiteral("VS Code")}));
    QCOMPARE(*entry.description, QStringLiteral("Code editor"));
    QCOMPARE(*entry.homepage, QStringLiteral("https://code.visualstudio.com/"));
    QCOMPARE(*entry.version, QStringLiteral("1.90.0"));
    QVERIFY(!entry.deprecated);
    QCOMPARE(entry.appArtifacts, QStringList({QStringLiteral("Visual Studio Code.app")}));
    QCOMPARE(entry.displayName(), QStringLiteral("Visual Studio Code"));
}

void TestCatalogStore::testParseBareArray()
{
    const auto entries = rb::CatalogLoader::parse(
        R"([{"token": "firefox", "name": "Firefox", "deprecated": true}, {"token": "slack"}])");
    QVERIFY(entries.has_value());
    QCOMPARE(static_cast<int>(entries->size()), 2);
    QCOMPARE(entries->at(0).names, QStringList({QStringLiteral("Firefox")}));
    QVERIFY(entries->at(0).deprecated);
    QVERIFY(entries->at(1).names.isEmpty());
    QCOMPARE(entries->at(1).displayName(), QStringLiteral("slack"));
}

void TestCatalogStore::testParseRejectsNonCatalogDocuments()
{
    QVERIFY(!rb::CatalogLoader::parse("{ nope").has_value());
    QVERIFY(!rb::CatalogLoader::parse(R"({"items": []})").has_value());
    QVERIFY(!rb::CatalogLoader::parse(R"("just a string")").has_value());

    const auto empty = rb::CatalogLoader::parse(R"({"data": []})");
    QVERIFY(empty.has_value());
    QVERIFY(empty->empty());
}

void TestCatalogStore::testEntryDefaultsAndSkips()
{
    const auto entries = rb::CatalogLoader::parse(
        R"([{"token": "  "}, {"name": ["No Token"]}, 42, {"token": "iterm2", "name": ["iTerm2", ""]}])");
    QVERIFY(entries.has_value());
    QCOMPARE(static_cast<int>(entries->size()), 1);
    QCOMPARE(entries->front().fullToken, QStringLiteral("iterm2"));
    QCOMPARE(entries->front().names, QStringList({QStringLiteral("iTerm2")}));
    QVERIFY(!entries->front().description.has_value());
}

void TestCatalogStore::testLoadFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(!rb::CatalogLoader::loadFile(dir.filePath(QStringLiteral("missing.json"))).has_value());

    const QString path = dir.filePath(QStringLiteral("catalog.json"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(R"({"data": [{"token": "firefox", "name": ["Firefox"]}]})");
    file.close();

    const auto entries = rb::CatalogLoader::loadFile(path);
    QVERIFY(entries.has_value());
    QCOMPARE(entries->front().token, QStringLiteral("firefox"));
}

void TestCatalogStore::testLookupByNameOrToken()
{
    const rb::CatalogStore store({
        makePackage(QStringLiteral("visual-studio-code"),
                    {QStringLiteral("Visual Studio Code"), QStringLiteral("VS Code")}),
        makePackage(QStringLiteral("firefox"), {QStringLiteral("Firefox")}),
    });

    QCOMPARE(store.size(), size_t(2));
    QCOMPARE(store.lookupByNameOrToken(QStringLiteral("vs code"))->token,
             QStringLiteral("visual-studio-code"));
    QCOMPARE(store.lookupByNameOrToken(QStringLiteral("VISUAL-STUDIO-CODE"))->token,
             QStringLiteral("visual-studio-code"));
    QCOMPARE(store.lookupByNameOrToken(QStringLiteral("firefox"))->token, QStringLiteral("firefox"));
    QVERIFY(!store.lookupByNameOrToken(QStringLiteral("fire")).has_value());
    QVERIFY(!store.lookupByNameOrToken(QString()).has_value());
}

void TestCatalogStore::testLookupByAppFilename()
{
    const rb::CatalogStore store({
        makePackage(QStringLiteral("visual-studio-code"), {QStringLiteral("Visual Studio Code")},
                    {QStringLiteral("Visual Studio Code.app")}),
    });

    QVERIFY(store.lookupByAppFilename(QStringLiteral("visual studio code.APP")).has_value());
    QVERIFY(!store.lookupByAppFilename(QStringLiteral("Code.app")).has_value());
}

void TestCatalogStore::testLaterEntryWinsCollisions()
{
    const rb::CatalogStore store({
        makePackage(QStringLiteral("docker"), {QStringLiteral("Docker")}),
        makePackage(QStringLiteral("docker-desktop"), {QStringLiteral("Docker")}),
    });

    QCOMPARE(store.lookupByNameOrToken(QStringLiteral("docker"))->token,
             QStringLiteral("docker-desktop"));
    QCOMPARE(store.lookupByNameOrToken(QStringLiteral("docker-desktop"))->token,
             QStringLiteral("docker-desktop"));
}

void TestCatalogStore::testMatchProgram()
{
    const rb::CatalogStore store({
        makePackage(QStringLiteral("visual-studio-code"), {QStringLiteral("Visual Studio Code")},
                    {QStringLiteral("Visual Studio Code.app")}),
        makePackage(QStringLiteral("gimp"), {QStringLiteral("GIMP")}),
    });

    QCOMPARE(store.matchProgram(QStringLiteral("visual studio code"), std::nullopt)->token,
             QStringLiteral("visual-studio-code"));
    QCOMPARE(store.matchProgram(QStringLiteral("Code"),
                                QStringLiteral("/Applications/Visual Studio Code.app"))->token,
             QStringLiteral("visual-studio-code"));
    QCOMPARE(store.matchProgram(QStringLiteral("GNU Image Manipulation Program"),
                                QStringLiteral("/usr/share/applications/gimp.desktop"))->token,
             QStringLiteral("gimp"));
    QVERIFY(!store.matchProgram(QStringLiteral("Unknown"),
                                QStringLiteral("/opt/unknown.desktop")).has_value());
    QVERIFY(!store.matchProgram(QStringLiteral("Unknown"), std::nullopt).has_value());
}

QTEST_MAIN(TestCatalogStore)
#include "test_catalog_store.moc"
