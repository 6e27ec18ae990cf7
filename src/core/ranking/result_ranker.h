#pragma once

#include "core/filter/safety_filter.h"
#include "core/shared/candidate.h"
#include "core/shared/ranking_policy.h"

#include <QString>

#include <array>
#include <cstddef>
#include <memory>
#include <vector>

namespace pt {

class TierClassifier;

struct RankingOutcome {
    // Survivors, best first, annotated with tier/rankScore/rankBreakdown.
    std::vector<Candidate> ranked;

    // Excluded by SafetyFilter; these never appear in `ranked`.
    RejectionStats rejections;

    // Forensic demotions; these are in `ranked`, always last.
    int trashCount = 0;

    // Survivor histogram indexed by tier value - 1.
    std::array<int, 5> tierCounts{};

    int rejectedCount() const { return rejections.total(); }
    int countForTier(Tier tier) const { return tierCounts[static_cast<size_t>(tier) - 1]; }
};

// Ranks one batch of peer search results against a target track.
//
// Per candidate (independent, fanned out over worker threads for larger
// batches): SafetyFilter, then TierClassifier. Survivors are stable-sorted
// with TierComparator and annotated by RankReporter. Deterministic: the same
// batch and policy always produce the same ordering and annotations.
class ResultRanker {
public:
    static constexpr size_t kParallelThreshold = 64;
    static constexpr size_t kMaxWorkers = 8;

    // Returns nullptr (and fills error) if the policy does not validate.
    static std::unique_ptr<ResultRanker> create(const RankingPolicy& policy,
                                                QString* error = nullptr);

    // queryText defaults to target.queryText() when empty.
    RankingOutcome rank(std::vector<Candidate> batch, const Target& target,
                        const QString& queryText = {}) const;

    const RankingPolicy& policy() const { return m_policy; }

    // Worker threads used for a batch of the given size (1 = inline).
    static size_t computeWorkerCount(size_t batchSize);

private:
    explicit ResultRanker(const RankingPolicy& policy);

    struct Evaluation {
        RejectionReason rejection = RejectionReason::None;
        Tier tier = Tier::Trash;
    };

    void evaluateRange(const std::vector<Candidate>& batch, std::vector<Evaluation>& out,
                       size_t begin, size_t end, const SafetyFilter& filter,
                       const TierClassifier& classifier, const QString& queryText,
                       const Target& target) const;

    RankingPolicy m_policy;
};

} // namespace pt
