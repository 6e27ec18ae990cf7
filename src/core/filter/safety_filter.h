#pragma once

#include "core/shared/candidate.h"
#include "core/shared/ranking_policy.h"

#include <QString>

#include <optional>

namespace pt {

// Why a candidate was excluded before tiering. Rules are evaluated in this order.
enum class RejectionReason {
    None,
    BlockedSource,
    DurationMismatch,
    BelowBitrateFloor,
    TokenMismatch,
};

QString rejectionReasonToString(RejectionReason reason);

// Per-reason exclusion counts for one ranking call.
struct RejectionStats {
    int blockedSource = 0;
    int durationMismatch = 0;
    int belowBitrateFloor = 0;
    int tokenMismatch = 0;

    void record(RejectionReason reason);
    int total() const;
};

// Cheap pre-pass that excludes candidates before any scoring work happens.
// Keeps its own copy of the policy.
class SafetyFilter {
public:
    explicit SafetyFilter(const RankingPolicy& policy);

    // First rule that rejects the candidate, or RejectionReason::None.
    RejectionReason evaluate(const Candidate& candidate, const QString& queryText,
                             std::optional<int> targetLengthSeconds) const;

    bool isSafe(const Candidate& candidate, const QString& queryText,
                std::optional<int> targetLengthSeconds) const
    {
        return evaluate(candidate, queryText, targetLengthSeconds) == RejectionReason::None;
    }

    // Shared with TierClassifier: true when both lengths are known and their
    // difference exceeds the policy tolerance. Non-positive lengths are unknown.
    static bool exceedsDurationTolerance(const Candidate& candidate,
                                         std::optional<int> targetLengthSeconds,
                                         const RankingPolicy& policy);

private:
    RankingPolicy m_policy;
};

} // namespace pt
