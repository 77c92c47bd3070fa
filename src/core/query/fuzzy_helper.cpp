#include "core/query/fuzzy_helper.h"

#include <cstdlib>

namespace rb {

QString FuzzyHelper::wildcardPattern(const QString& lowercasedQuery)
{
    if (lowercasedQuery.isEmpty()) {
        return QStringLiteral("*");
    }

    QString pattern;
    pattern.reserve(lowercasedQuery.size() * 2 + 1);
    pattern.append(QLatin1Char('*'));
    for (QChar ch : lowercasedQuery) {
        pattern.append(ch);
        pattern.append(QLatin1Char('*'));
    }
    return pattern;
}

QRegularExpression FuzzyHelper::wildcardToRegularExpression(const QString& pattern)
{
    const QStringList literals = pattern.split(QLatin1Char('*'));
    QStringList escaped;
    escaped.reserve(literals.size());
    for (const QString& literal : literals) {
        escaped.append(QRegularExpression::escape(literal));
    }

    const QString expression = QStringLiteral("\\A(?:%1)\\z")
                                   .arg(escaped.join(QStringLiteral(".*")));
    return QRegularExpression(expression,
                              QRegularExpression::CaseInsensitiveOption
                                  | QRegularExpression::DotMatchesEverythingOption);
}

QStringList FuzzyHelper::tokens(const QString& text)
{
    QStringList result;
    QString current;
    for (QChar ch : text) {
        if (ch.isLetterOrNumber()) {
            current.append(ch.toLower());
            continue;
        }
        if (!current.isEmpty()) {
            result.append(current);
            current.clear();
        }
    }
    if (!current.isEmpty()) {
        result.append(current);
    }
    return result;
}

bool FuzzyHelper::isEditDistanceLeOne(const QString& a, const QString& b)
{
    if (a == b) {
        return true;
    }

    const int la = a.size();
    const int lb = b.size();
    if (std::abs(la - lb) > 1) {
        return false;
    }

    int i = 0;
    int j = 0;
    int diffs = 0;
    while (i < la && j < lb) {
        if (a.at(i) == b.at(j)) {
            ++i;
            ++j;
            continue;
        }

        ++diffs;
        if (diffs > 1) {
            return false;
        }

        if (la == lb) {
            // substitution
            ++i;
            ++j;
        } else if (la > lb) {
            // deletion from a
            ++i;
        } else {
            // insertion into a
            ++j;
        }
    }

    if (i < la || j < lb) {
        ++diffs;
    }
    return diffs <= 1;
}

} // namespace rb
