#include "core/shared/search_query.h"

namespace rb {

SearchQuery::SearchQuery(const QString& rawInput)
    : raw(rawInput)
    , trimmed(rawInput.trimmed())
    , lowercased(trimmed.toLower())
{
}

} // namespace rb
