#pragma once

#include "core/shared/candidate.h"
#include "core/shared/ranking_policy.h"

#include <functional>
#include <optional>

namespace pt {

// Forensic predicate: (candidate, expected length) -> likely fake.
// Swappable so detection rules can change without touching tiering.
using ForensicCheck = std::function<bool(const Candidate&, std::optional<int>)>;

// Assigns one of the five tiers to a single candidate. A deterministic
// decision table evaluated once per candidate:
//
//   1. forensic flag                               -> Trash
//   2. no free slot and queue deeper than 500      -> Bronze
//   3. duration outside tolerance (when enforced)  -> Bronze
//   4. priority-specific quality/metadata table
class TierClassifier {
public:
    static constexpr int kAvailabilityVetoQueueDepth = 500;

    // Uses ForensicDetector with the policy's thresholds.
    TierClassifier(const RankingPolicy& policy, const Target& target);
    TierClassifier(const RankingPolicy& policy, const Target& target, ForensicCheck forensicCheck);

    Tier classify(const Candidate& candidate) const;

    // Target has no BPM, or candidate BPM is strictly within policy.bpmTolerance of it.
    bool bpmMatches(const Candidate& candidate) const;

    // Numeric BPM, or "bpm" mentioned in the filename.
    static bool hasBpmHint(const Candidate& candidate);
    static bool hasKey(const Candidate& candidate);

    // flac or wav. Other lossless containers are tiered by bitrate alone.
    static bool isLossless(const Candidate& candidate);

private:
    Tier classifyDjReady(const Candidate& candidate, bool isHighQuality, bool isMidQuality) const;
    Tier classifyQualityFirst(const Candidate& candidate, bool isLossless,
                              bool isHighQuality, bool isMidQuality) const;

    RankingPolicy m_policy;
    Target m_target;
    ForensicCheck m_forensicCheck;
};

} // namespace pt
