#pragma once

#include "core/shared/ranking_policy.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace pt {

// PolicyStore -- JSON save/load for the ranking policy.
//
// The default location is:
//   <GenericDataLocation>/peertier/ranking_policy.json
// or $PEERTIER_POLICY_FILE when set.
//
// A document may name a base preset ("qualityFirst" or "djReady"); every
// other key overrides that preset's value. Policies are validated before
// they are returned, so a loaded policy is always usable.
class PolicyStore {
public:
    // Load from the default location. Returns nullopt if the file is missing,
    // unreadable, or holds an invalid policy.
    static std::optional<RankingPolicy> load();

    static std::optional<RankingPolicy> loadFromFile(const QString& filePath,
                                                     QString* error = nullptr);

    // Save to the default location. Creates the directory if needed.
    static bool save(const RankingPolicy& policy, QString* error = nullptr);

    // Refuses a policy that does not validate. The file is replaced atomically.
    static bool saveToFile(const RankingPolicy& policy, const QString& filePath,
                           QString* error = nullptr);

    static QString policyFilePath();

    static QJsonObject toJson(const RankingPolicy& policy);
    static std::optional<RankingPolicy> fromJson(const QJsonObject& json,
                                                 QString* error = nullptr);
};

} // namespace pt
