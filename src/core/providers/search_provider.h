#pragma once

#include "core/shared/search_query.h"
#include "core/shared/search_result.h"

#include <vector>

namespace rb {

// SearchProvider: one independent source of candidates.
//
// search() runs on a conductor worker thread and may block on I/O. It must not
// touch state shared with other providers. An empty query yields no results.
// Implementations report their own failures by logging and returning an
// empty vector; the conductor additionally guards against exceptions.
class SearchProvider {
public:
    virtual ~SearchProvider() = default;

    virtual SearchSource source() const = 0;
    virtual std::vector<ProviderResult> search(const SearchQuery& query) = 0;
};

} // namespace rb
