#pragma once

#include "core/programs/program_index.h"

#include <QStringList>

#include <mutex>

namespace rb {

// DesktopEntryIndex: ProgramIndex backed by XDG .desktop files.
//
// Scans every applications directory once, on first query, and keeps the
// parsed records in memory until refresh(). When two directories provide the
// same desktop file id, the directory listed first wins.
class DesktopEntryIndex : public ProgramIndex {
public:
    // Empty directories means the XDG applications locations.
    explicit DesktopEntryIndex(QStringList directories = {});

    std::optional<std::vector<ProgramRecord>> query(const QString& wildcard,
                                                    int limit) override;

    // Drops the cached scan; the next query rescans.
    void refresh();

    const QStringList& directories() const { return m_directories; }

    // Parses one .desktop file. Returns nullopt for anything that is not a
    // visible Type=Application entry.
    static std::optional<ProgramRecord> parseDesktopFile(const QString& filePath,
                                                         const QString& desktopId);

private:
    void ensureScannedLocked();

    QStringList m_directories;

    std::mutex m_mutex;
    bool m_scanned = false;
    std::vector<ProgramRecord> m_records;
};

} // namespace rb
