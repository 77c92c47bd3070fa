#include <QtTest/QtTest>
#include "core/history/sqlite_history_storage.h"

#include <QTemporaryDir>

#include <sqlite3.h>

class TestSqliteHistoryStorage : public QObject {
    Q_OBJECT

private slots:
    void testOpenCreatesParentDirectory()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("nested/deeper/history.db"));

        auto storage = rb::SqliteHistoryStorage::open(path);
        QVERIFY(storage != nullptr);
        QCOMPARE(storage->path(), path);
        QVERIFY(QFileInfo::exists(path));

        const auto loaded = storage->load();
        QVERIFY(loaded.has_value());
        QVERIFY(loaded->empty());
    }

    void testOpenFailsOnUnusablePath()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        // A regular file where the parent directory should be.
        const QString blocker = dir.filePath(QStringLiteral("blocker"));
        QFile file(blocker);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("x");
        file.close();

        QVERIFY(rb::SqliteHistoryStorage::open(blocker + QStringLiteral("/history.db")) == nullptr);
    }

    void testSaveAndReloadPreservesOrderAndFields()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("history.db"));

        rb::HistoryTarget target;
        target.kind = rb::HistoryTarget::Kind::InstalledProgram;
        target.ref = QStringLiteral("/usr/share/applications/code.desktop");
        target.name = QStringLiteral("Visual Studio Code");
        target.bundleId = QStringLiteral("code.desktop");

        std::vector<rb::HistoryEntry> entries(2);
        entries[0].command = QStringLiteral("code");
        entries[0].display = QStringLiteral("Visual Studio Code");
        entries[0].subtitle = QStringLiteral("Editor");
        entries[0].target = target;
        entries[1].command = QStringLiteral("ls -la ~/src");

        {
            auto storage = rb::SqliteHistoryStorage::open(path);
            QVERIFY(storage != nullptr);
            QVERIFY(storage->save(entries));
        }

        auto reopened = rb::SqliteHistoryStorage::open(path);
        QVERIFY(reopened != nullptr);
        const auto loaded = reopened->load();
        QVERIFY(loaded.has_value());
        QCOMPARE(static_cast<int>(loaded->size()), 2);

        const rb::HistoryEntry& first = loaded->at(0);
        QCOMPARE(first.command, QStringLiteral("code"));
        QCOMPARE(*first.display, QStringLiteral("Visual Studio Code"));
        QCOMPARE(*first.subtitle, QStringLiteral("Editor"));
        QVERIFY(first.target.has_value());
        QVERIFY(*first.target == target);

        const rb::HistoryEntry& second = loaded->at(1);
        QCOMPARE(second.command, QStringLiteral("ls -la ~/src"));
        QVERIFY(!second.display.has_value());
        QVERIFY(!second.subtitle.has_value());
        QVERIFY(!second.target.has_value());
    }

    void testSaveReplacesPreviousList()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        auto storage = rb::SqliteHistoryStorage::open(dir.filePath(QStringLiteral("history.db")));
        QVERIFY(storage != nullptr);

        std::vector<rb::HistoryEntry> first(3);
        first[0].command = QStringLiteral("a");
        first[1].command = QStringLiteral("b");
        first[2].command = QStringLiteral("c");
        QVERIFY(storage->save(first));

        std::vector<rb::HistoryEntry> second(1);
        second[0].command = QStringLiteral("z");
        QVERIFY(storage->save(second));

        const auto loaded = storage->load();
        QVERIFY(loaded.has_value());
        QCOMPARE(static_cast<int>(loaded->size()), 1);
        QCOMPARE(loaded->front().command, QStringLiteral("z"));

        QVERIFY(storage->save({}));
        QVERIFY(storage->load()->empty());
    }

    void testCorruptRowsAreSkipped()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("history.db"));

        {
            auto storage = rb::SqliteHistoryStorage::open(path);
            QVERIFY(storage != nullptr);
        }

        sqlite3* db = nullptr;
        QCOMPARE(sqlite3_open(path.toUtf8().constData(), &db), SQLITE_OK);
        const char* rows = R"(
            INSERT INTO command_history VALUES (0, 'good', NULL, NULL, NULL);
            INSERT INTO command_history VALUES (1, '   ', NULL, NULL, NULL);
            INSERT INTO command_history VALUES (2, 'broken-json', NULL, NULL, '{not json');
            INSERT INTO command_history VALUES (3, 'bad-kind', NULL, NULL, '{"kind":"rocket","ref":"x"}');
            INSERT INTO command_history VALUES (4, 'site', NULL, NULL, '{"kind":"url","ref":"https://example.com"}');
            INSERT INTO command_history VALUES (5, 'empty-target', NULL, NULL, '');
        )";
        QCOMPARE(sqlite3_exec(db, rows, nullptr, nullptr, nullptr), SQLITE_OK);
        sqlite3_close(db);

        auto storage = rb::SqliteHistoryStorage::open(path);
        QVERIFY(storage != nullptr);
        const auto loaded = storage->load();
        QVERIFY(loaded.has_value());
        QCOMPARE(static_cast<int>(loaded->size()), 3);
        QCOMPARE(loaded->at(0).command, QStringLiteral("good"));
        QCOMPARE(loaded->at(1).command, QStringLiteral("site"));
        QCOMPARE(loaded->at(1).target->kind, rb::HistoryTarget::Kind::Url);
        QCOMPARE(loaded->at(2).command, QStringLiteral("empty-target"));
        QVERIFY(!loaded->at(2).target.has_value());
    }

    void testCommandHistoryPersistsAcrossRestarts()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("history.db"));

        {
            rb::CommandHistory history(rb::SqliteHistoryStorage::open(path));
            QVERIFY(history.record(QStringLiteral("firefox")));
            QVERIFY(history.record(QStringLiteral("code"), QStringLiteral("Visual Studio Code")));
            QVERIFY(history.remove(QStringLiteral("firefox")));
        }

        rb::CommandHistory restored(rb::SqliteHistoryStorage::open(path));
        const auto entries = restored.entries();
        QCOMPARE(static_cast<int>(entries.size()), 1);
        QCOMPARE(entries[0].command, QStringLiteral("code"));
        QCOMPARE(*entries[0].display, QStringLiteral("Visual Studio Code"));
    }
};

QTEST_MAIN(TestSqliteHistoryStorage)
#include "test_sqlite_history_storage.moc"
