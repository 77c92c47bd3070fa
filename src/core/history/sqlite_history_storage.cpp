#include "core/history/sqlite_history_storage.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>

#include <sqlite3.h>

namespace rb {

namespace {

constexpr const char* kSchema = R"(
    CREATE TABLE IF NOT EXISTS command_history (
        position    INTEGER PRIMARY KEY,
        command     TEXT NOT NULL,
        display     TEXT,
        subtitle    TEXT,
        target_json TEXT
    )
)";

std::optional<QString> columnText(sqlite3_stmt* stmt, int column)
{
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    if (!text) {
        return std::nullopt;
    }
    return QString::fromUtf8(text);
}

void bindOptionalText(sqlite3_stmt* stmt, int index, const std::optional<QString>& value,
                      QByteArray& storage)
{
    if (!value.has_value()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    storage = value->toUtf8();
    sqlite3_bind_text(stmt, index, storage.constData(), -1, SQLITE_STATIC);
}

} // namespace

SqliteHistoryStorage::~SqliteHistoryStorage()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::unique_ptr<SqliteHistoryStorage> SqliteHistoryStorage::open(const QString& dbPath)
{
    std::unique_ptr<SqliteHistoryStorage> storage(new SqliteHistoryStorage());
    if (!storage->init(dbPath)) {
        return nullptr;
    }
    return storage;
}

bool SqliteHistoryStorage::init(const QString& dbPath)
{
    m_path = dbPath;

    const QString dir = QFileInfo(dbPath).absolutePath();
    if (!QDir().mkpath(dir)) {
        LOG_ERROR(rbHistory, "Cannot create history directory: %s", qUtf8Printable(dir));
        return false;
    }

    const int rc = sqlite3_open(dbPath.toUtf8().constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(rbHistory, "Failed to open history database: %s",
                  m_db ? sqlite3_errmsg(m_db) : "out of memory");
        return false;
    }

    sqlite3_busy_timeout(m_db, 5000);

    if (!execSql(kSchema)) {
        LOG_ERROR(rbHistory, "Failed to create history schema");
        return false;
    }

    LOG_INFO(rbHistory, "History database opened: %s", qUtf8Printable(dbPath));
    return true;
}

bool SqliteHistoryStorage::execSql(const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(rbHistory, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

std::optional<std::vector<HistoryEntry>> SqliteHistoryStorage::load()
{
    if (!m_db) {
        LOG_WARN(rbHistory, "SqliteHistoryStorage::load called without a database");
        return std::nullopt;
    }

    static constexpr const char* kSql = R"(
        SELECT command, display, subtitle, target_json
        FROM command_history
        ORDER BY position ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(rbHistory, "History load prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    std::vector<HistoryEntry> entries;
    int skipped = 0;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const auto command = columnText(stmt, 0);
        if (!command.has_value() || command->trimmed().isEmpty()) {
            ++skipped;
            continue;
        }

        HistoryEntry entry;
        entry.command = *command;
        entry.display = columnText(stmt, 1);
        entry.subtitle = columnText(stmt, 2);

        const auto targetJson = columnText(stmt, 3);
        if (targetJson.has_value() && !targetJson->isEmpty()) {
            QJsonParseError parseError;
            const QJsonDocument doc = QJsonDocument::fromJson(targetJson->toUtf8(), &parseError);
            std::optional<HistoryTarget> target;
            if (parseError.error == QJsonParseError::NoError && doc.isObject()) {
                target = HistoryTarget::fromJson(doc.object());
            }
            if (!target.has_value()) {
                ++skipped;
                continue;
            }
            entry.target = std::move(target);
        }

        entries.push_back(std::move(entry));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_WARN(rbHistory, "History load step failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    if (skipped > 0) {
        LOG_WARN(rbHistory, "Skipped %d corrupt history rows", skipped);
    }
    return entries;
}

bool SqliteHistoryStorage::save(const std::vector<HistoryEntry>& entries)
{
    if (!m_db) {
        LOG_WARN(rbHistory, "SqliteHistoryStorage::save called without a database");
        return false;
    }

    if (!execSql("BEGIN TRANSACTION")) {
        return false;
    }
    if (!execSql("DELETE FROM command_history")) {
        execSql("ROLLBACK");
        return false;
    }

    static constexpr const char* kSql = R"(
        INSERT INTO command_history (position, command, display, subtitle, target_json)
        VALUES (?1, ?2, ?3, ?4, ?5)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(rbHistory, "History save prepare failed: %s", sqlite3_errmsg(m_db));
        execSql("ROLLBACK");
        return false;
    }

    for (size_t i = 0; i < entries.size(); ++i) {
        const HistoryEntry& entry = entries[i];
        const QByteArray commandUtf8 = entry.command.toUtf8();
        QByteArray displayUtf8;
        QByteArray subtitleUtf8;
        QByteArray targetUtf8;

        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(i));
        sqlite3_bind_text(stmt, 2, commandUtf8.constData(), -1, SQLITE_STATIC);
        bindOptionalText(stmt, 3, entry.display, displayUtf8);
        bindOptionalText(stmt, 4, entry.subtitle, subtitleUtf8);
        std::optional<QString> targetJson;
        if (entry.target.has_value()) {
            targetJson = QString::fromUtf8(
                QJsonDocument(entry.target->toJson()).toJson(QJsonDocument::Compact));
        }
        bindOptionalText(stmt, 5, targetJson, targetUtf8);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            LOG_WARN(rbHistory, "History save step failed: %s", sqlite3_errmsg(m_db));
            sqlite3_finalize(stmt);
            execSql("ROLLBACK");
            return false;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    sqlite3_finalize(stmt);

    if (!execSql("COMMIT")) {
        execSql("ROLLBACK");
        return false;
    }
    return true;
}

} // namespace rb
