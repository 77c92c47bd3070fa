#pragma once

#include <QString>

namespace rb {

// Immutable view of the user's input shared with every provider of one search.
struct SearchQuery {
    QString raw;
    QString trimmed;
    QString lowercased;

    SearchQuery() = default;
    explicit SearchQuery(const QString& rawInput);

    bool isEmpty() const { return trimmed.isEmpty(); }
};

} // namespace rb
