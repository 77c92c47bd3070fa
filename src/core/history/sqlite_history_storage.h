#pragma once

#include "core/history/command_history.h"

#include <QString>

#include <memory>

struct sqlite3;

namespace rb {

// SqliteHistoryStorage: persists CommandHistory in a single SQLite table.
//
//   command_history(position INTEGER PRIMARY KEY, command TEXT NOT NULL,
//                   display TEXT, subtitle TEXT, target_json TEXT)
//
// position 0 is the most recent entry. save() replaces every row inside one
// transaction, so a failed write leaves the previous list intact.
class SqliteHistoryStorage : public HistoryStorage {
public:
    ~SqliteHistoryStorage() override;

    SqliteHistoryStorage(const SqliteHistoryStorage&) = delete;
    SqliteHistoryStorage& operator=(const SqliteHistoryStorage&) = delete;

    // Opens or creates the database. Returns nullptr if the file cannot be
    // opened or the schema cannot be created.
    static std::unique_ptr<SqliteHistoryStorage> open(const QString& dbPath);

    std::optional<std::vector<HistoryEntry>> load() override;
    bool save(const std::vector<HistoryEntry>& entries) override;

    const QString& path() const { return m_path; }

private:
    SqliteHistoryStorage() = default;

    bool init(const QString& dbPath);
    bool execSql(const char* sql);

    sqlite3* m_db = nullptr;
    QString m_path;
};

} // namespace rb
