#pragma once

#include "core/shared/search_result.h"

#include <QString>
#include <QVariantMap>

#include <optional>

namespace rb {

class DebugScoreRecorder;

// Per-variant presentation of a result row. History rows whose target still
// resolves present exactly like that target.
class ResultPresentation {
public:
    static constexpr int kSubtitleRowHeight = 44;
    static constexpr int kTitleOnlyRowHeight = 40;

    static QString title(const SearchResult& result);
    static std::optional<QString> subtitle(const SearchResult& result);
    static QString actionHint(const SearchResult& result);
    static int rowHeight(const SearchResult& result);

    // Row for list models: title, subtitle, kind, identity, actionHint,
    // isRecent, rowHeight and, when a recorder is given and knows the
    // result, its score.
    static QVariantMap toRow(const SearchResult& result,
                             const DebugScoreRecorder* scores = nullptr);

    // Trims and flattens newlines; nullopt for blank text.
    static std::optional<QString> sanitized(const std::optional<QString>& text);

    static QString abbreviateHome(const QString& text);
};

} // namespace rb
