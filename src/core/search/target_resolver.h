#pragma once

#include "core/history/command_history.h"
#include "core/shared/search_result.h"

#include <memory>

namespace rb {

class CatalogStore;

// TargetResolver: turns a stored HistoryTarget back into a live result.
//
// Resolution reflects the current state of the machine: a program or file
// that no longer exists, or a package that left the catalog, resolves to
// nothing and the history row falls back to its plain command.
class TargetResolver {
public:
    explicit TargetResolver(std::shared_ptr<const CatalogStore> catalog);

    std::optional<SearchResult> resolve(const HistoryTarget& target) const;

    // Builds the HistoryCommand row for a stored entry, with its target
    // re-resolved.
    HistoryCommand toHistoryCommand(const HistoryEntry& entry, bool isRecent) const;

private:
    std::shared_ptr<const CatalogStore> m_catalog;
};

} // namespace rb
