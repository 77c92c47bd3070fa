#pragma once

#include "core/catalog/catalog_entry.h"
#include "core/history/history_target.h"

#include <QJsonObject>
#include <QString>

#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace rb {

class SearchResult;

// Program found by the OS program index.
struct InstalledProgram {
    QString name;
    std::optional<QString> path;
    std::optional<QString> bundleId;
    std::optional<QString> description;
    std::optional<CatalogEntry> catalogEntry;  // package that provides this program, if known
};

// Previously successful command. When the entry recorded a target, the
// conductor attaches the re-resolved target so the row behaves like it.
struct HistoryCommand {
    QString command;
    std::optional<QString> display;
    std::optional<QString> subtitle;
    bool isRecent = false;
    std::optional<HistoryTarget> target;
    std::shared_ptr<const SearchResult> resolvedTarget;
};

struct UrlTarget {
    QString url;
};

struct FileSystemEntry {
    QString path;
    bool isDirectory = false;
    std::optional<QString> displayOverride;

    // Last path component, with a trailing '/' for directories.
    QString displayName() const;
};

enum class ResultKind {
    InstalledProgram,
    CatalogEntry,
    HistoryCommand,
    Url,
    FileSystemEntry,
};

QString resultKindToString(ResultKind kind);

// Closed sum type over everything a search can return. Per-variant behavior
// is a switch over kind(), not virtual dispatch.
class SearchResult {
public:
    using Value = std::variant<InstalledProgram, CatalogEntry, HistoryCommand,
                               UrlTarget, FileSystemEntry>;

    SearchResult(InstalledProgram program) : m_value(std::move(program)) {}
    SearchResult(CatalogEntry entry) : m_value(std::move(entry)) {}
    SearchResult(HistoryCommand command) : m_value(std::move(command)) {}
    SearchResult(UrlTarget url) : m_value(std::move(url)) {}
    SearchResult(FileSystemEntry entry) : m_value(std::move(entry)) {}

    ResultKind kind() const;
    const Value& value() const { return m_value; }

    template <typename T>
    const T* as() const { return std::get_if<T>(&m_value); }

    template <typename T>
    T* as() { return std::get_if<T>(&m_value); }

    bool isInstalled() const { return kind() == ResultKind::InstalledProgram; }
    bool isHistory() const { return kind() == ResultKind::HistoryCommand; }

    QString displayName() const;

    // Canonical key used to decide whether two results are the same entity,
    // regardless of which provider produced them.
    QString identityKey() const;

    QJsonObject toJson() const;

private:
    Value m_value;
};

// High-level source identifiers so the conductor can reason about
// cross-source ranking.
enum class SearchSource {
    InstalledPrograms,
    Catalog,
    CommandHistory,
};

QString searchSourceToString(SearchSource source);

// Provider-scored result prior to the conductor's rerank. Scores are only
// comparable across sources after priority tiers are applied.
struct ProviderResult {
    SearchSource source = SearchSource::InstalledPrograms;
    SearchResult result;
    int score = 0;
};

} // namespace rb
