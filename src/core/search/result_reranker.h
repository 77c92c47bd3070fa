#pragma once

#include "core/shared/search_query.h"
#include "core/shared/search_result.h"

#include <vector>

namespace rb {

struct RankedResult {
    SearchResult result;
    int score = 0;
    int tier = 0;
};

// ResultReranker: merges every provider's output into one ordered list.
//
//   1. Catalog packages whose programs are already installed are dropped. An
//      app artifact matches an installed program by file name, by file name
//      without extension, or by the program's name.
//   2. A history row whose display name equals an installed program's folds
//      its score into that program and disappears. Rows without a display
//      name never fold.
//   3. Stable sort by tier, then score, then display name.
//   4. Deduplicate by identity key. A non-history result is also dropped when
//      its display name was already shown; history rows are exempt so a typed
//      command can sit next to the program it once launched.
class ResultReranker {
public:
    static constexpr int kInstalledExactTier = 5;
    static constexpr int kHistoryExactTier = 4;
    static constexpr int kPrimaryTier = 3;
    static constexpr int kSecondaryTier = 1;

    static std::vector<RankedResult> rerank(const std::vector<ProviderResult>& results,
                                            const SearchQuery& query);

    static int priority(const SearchResult& result, const SearchQuery& query);
};

} // namespace rb
