#pragma once

#include <QRegularExpression>
#include <QString>
#include <QStringList>

namespace rb {

// Pure lexical helpers shared by the providers. None of them allocate state
// beyond their return values, so they are safe to call from any worker.
class FuzzyHelper {
public:
    // Glyph-interleaved wildcard: "abc" -> "*a*b*c*"; "" -> "*".
    static QString wildcardPattern(const QString& lowercasedQuery);

    // Converts a '*'-only wildcard into an anchored, case-insensitive regex.
    // Every other character is matched literally.
    static QRegularExpression wildcardToRegularExpression(const QString& pattern);

    // Splits on non-alphanumeric boundaries into non-empty lowercase tokens.
    static QStringList tokens(const QString& text);

    // True iff a and b are equal or differ by exactly one substitution,
    // insertion or deletion. Pairs whose lengths differ by more than one are
    // rejected before any character is compared.
    static bool isEditDistanceLeOne(const QString& a, const QString& b);
};

} // namespace rb
