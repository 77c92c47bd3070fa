#include "launcher_runtime.h"
#include "core/catalog/catalog_loader.h"
#include "core/catalog/catalog_store.h"
#include "core/history/command_history.h"
#include "core/history/sqlite_history_storage.h"
#include "core/programs/desktop_entry_index.h"
#include "core/providers/catalog_provider.h"
#include "core/providers/history_provider.h"
#include "core/providers/installed_programs_provider.h"
#include "core/search/conductor.h"
#include "core/search/debug_score_recorder.h"
#include "core/search/target_resolver.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QFileInfo>
#include <QStandardPaths>

namespace rb {

LauncherRuntime::LauncherRuntime(Settings settings)
    : m_settings(SettingsManager::resolved(std::move(settings)))
    , m_classifier(QString(), m_settings.directoryListingLimit)
{
}

LauncherRuntime::~LauncherRuntime() = default;

void LauncherRuntime::initialize(std::shared_ptr<ProgramIndex> programIndex)
{
    std::vector<CatalogEntry> entries;
    if (QFileInfo::exists(m_settings.catalogPath)) {
        auto loaded = CatalogLoader::loadFile(m_settings.catalogPath);
        if (loaded.has_value()) {
            entries = std::move(*loaded);
        }
    } else {
        LOG_INFO(rbCatalog, "No catalog at %s; package search disabled",
                 qUtf8Printable(m_settings.catalogPath));
    }
    m_catalog = std::make_shared<const CatalogStore>(std::move(entries));

    std::unique_ptr<HistoryStorage> storage = SqliteHistoryStorage::open(m_settings.historyDbPath);
    if (!storage) {
        LOG_WARN(rbHistory, "History will not be persisted (%s)",
                 qUtf8Printable(m_settings.historyDbPath));
    }
    CommandHistoryConfig historyConfig;
    historyConfig.maxEntries = m_settings.historyMaxEntries;
    m_history = std::make_shared<CommandHistory>(std::move(storage), historyConfig);

    m_resolver = std::make_shared<const TargetResolver>(m_catalog);

    if (!programIndex) {
        QStringList dirs = m_settings.applicationDirs;
        if (!dirs.isEmpty()) {
            dirs.append(QStandardPaths::standardLocations(QStandardPaths::ApplicationsLocation));
        }
        programIndex = std::make_shared<DesktopEntryIndex>(dirs);
    }

    InstalledProgramsConfig programsConfig;
    programsConfig.resultLimit = m_settings.programResultLimit;

    std::vector<std::shared_ptr<SearchProvider>> providers;
    providers.push_back(std::make_shared<InstalledProgramsProvider>(programIndex, m_catalog,
                                                                    programsConfig));
    providers.push_back(std::make_shared<HistoryProvider>(m_history, m_resolver,
                                                          m_settings.historyMatchLimit));
    providers.push_back(std::make_shared<CatalogProvider>(m_catalog));

    ConductorConfig conductorConfig;
    conductorConfig.recentLimit = m_settings.recentLimit;
    conductorConfig.providerWorkers = m_settings.providerWorkers;
    conductorConfig.providerTimeoutMs = m_settings.providerTimeoutMs;

    m_conductor = std::make_unique<Conductor>(std::move(providers), m_history, m_resolver,
                                              conductorConfig);

    m_scoreRecorder = std::make_shared<DebugScoreRecorder>();
    std::weak_ptr<DebugScoreRecorder> recorder = m_scoreRecorder;
    m_conductor->setScoreObserver([recorder](quint64 generation,
                                             const QHash<QString, int>& scores) {
        if (auto locked = recorder.lock()) {
            locked->record(generation, scores);
        }
    });

    LOG_INFO(rbCore, "Runtime ready: %d catalog entries, %d history entries",
             static_cast<int>(m_catalog->size()), m_history->size());
}

} // namespace rb
