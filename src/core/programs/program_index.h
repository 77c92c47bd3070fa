#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace rb {

// One program known to the OS program index.
struct ProgramRecord {
    QString name;
    QString path;
    std::optional<QString> bundleId;
    std::optional<QString> description;
};

// ProgramIndex: abstract interface over the platform's program index.
//
// Implementations only understand '*' wildcards matched case-insensitively
// against the program name. Returns nullopt when the index itself failed;
// an empty vector means nothing matched.
class ProgramIndex {
public:
    virtual ~ProgramIndex() = default;

    virtual std::optional<std::vector<ProgramRecord>> query(const QString& wildcard,
                                                            int limit) = 0;
};

} // namespace rb
