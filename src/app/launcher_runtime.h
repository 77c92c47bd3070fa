#pragma once

#include "core/query/query_classifier.h"
#include "core/shared/settings.h"

#include <memory>

namespace rb {

class CatalogStore;
class CommandHistory;
class Conductor;
class DebugScoreRecorder;
class ProgramIndex;
class TargetResolver;

// LauncherRuntime: builds the search stack from Settings and owns it.
//
// Nothing here is a singleton: every component is created once and handed
// to the components that need it.
class LauncherRuntime {
public:
    explicit LauncherRuntime(Settings settings);
    ~LauncherRuntime();

    LauncherRuntime(const LauncherRuntime&) = delete;
    LauncherRuntime& operator=(const LauncherRuntime&) = delete;

    // Loads the catalog, opens the history database and starts the
    // conductor. A missing catalog or history database degrades to an empty
    // one. programIndex defaults to a DesktopEntryIndex.
    void initialize(std::shared_ptr<ProgramIndex> programIndex = nullptr);

    const Settings& settings() const { return m_settings; }
    Conductor* conductor() const { return m_conductor.get(); }
    std::shared_ptr<CommandHistory> history() const { return m_history; }
    std::shared_ptr<const CatalogStore> catalog() const { return m_catalog; }
    const QueryClassifier& classifier() const { return m_classifier; }
    DebugScoreRecorder* scoreRecorder() const { return m_scoreRecorder.get(); }

private:
    Settings m_settings;
    QueryClassifier m_classifier;

    std::shared_ptr<const CatalogStore> m_catalog;
    std::shared_ptr<CommandHistory> m_history;
    std::shared_ptr<const TargetResolver> m_resolver;
    std::shared_ptr<DebugScoreRecorder> m_scoreRecorder;
    std::unique_ptr<Conductor> m_conductor;
};

} // namespace rb
