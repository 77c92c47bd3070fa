#pragma once

#include "core/shared/search_result.h"

#include <QString>

#include <optional>
#include <vector>

namespace rb {

struct QueryClassification {
    enum class Kind {
        None,
        Url,
        Path,
    };

    Kind kind = Kind::None;
    QString url;
    std::vector<FileSystemEntry> entries;

    // Synthetic results to show ahead of provider output, in order.
    std::vector<SearchResult> results() const;
};

// QueryClassifier: decides whether the typed text is itself a URL or a
// filesystem path.
//
// Order of checks:
//   1. the whole string is a link ("scheme://..." or "host.tld[:port][/...]")
//   2. it contains a dot and no whitespace (implicit https://)
//   3. it looks like a path and resolves to something on disk
// Text starting with '/', '~' or '.' is never treated as a URL.
class QueryClassifier {
public:
    // baseDirectory anchors relative paths; empty means the home directory.
    explicit QueryClassifier(QString baseDirectory = {}, int listingLimit = 200);

    QueryClassification classify(const QString& input) const;

    // Returns the URL the text should open, or nullopt.
    static std::optional<QString> resolveUrl(const QString& trimmed);

    static bool looksLikePath(const QString& trimmed);

    // Expands '~' and anchors relative paths at the base directory.
    QString expandPath(const QString& trimmed) const;

    // Entries the path resolves to; empty when nothing on disk matches.
    std::vector<FileSystemEntry> resolvePath(const QString& trimmed) const;

private:
    std::vector<FileSystemEntry> listDirectory(const QString& dirPath,
                                               const QString& prefixFilter) const;

    QString m_baseDirectory;
    int m_listingLimit;
};

} // namespace rb
