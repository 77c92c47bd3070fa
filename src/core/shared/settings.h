#pragma once

#include <QString>
#include <QStringList>

namespace rb {

struct Settings {
    // Data files; empty means the default under the data directory
    QString catalogPath;
    QString historyDbPath;

    // History
    int historyMaxEntries = 200;
    int recentLimit = 8;
    int historyMatchLimit = 8;

    // Providers
    int programResultLimit = 300;
    int directoryListingLimit = 200;
    QStringList applicationDirs;  // extra .desktop directories

    // Conductor
    int providerWorkers = 3;
    int providerTimeoutMs = 2000;  // 0 = wait for every provider

    // Controller
    int debounceMs = 0;
};

} // namespace rb
