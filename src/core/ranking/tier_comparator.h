#pragma once

#include "core/shared/candidate.h"
#include "core/shared/ranking_policy.h"

#include <vector>

namespace pt {

// Orders classified candidates: tier first (Diamond before Trash), then the
// intra-tier cascade
//
//   1. free capacity before no free capacity
//   2. higher bitrate, when the bitrates differ significantly
//   3. shallower queue, when the queue depths differ significantly
//   4. shorter filename (missing filename sorts last)
//
// "Significantly" means by more than the policy gap. compare() applies the
// cascade to one pair. Pairwise gap rules are not transitive over three or
// more candidates, so sort() first groups bitrates and queue depths into
// clusters (see clusterIds) and orders the batch by cluster. Reads
// Candidate::tier; classify before comparing.
class TierComparator {
public:
    explicit TierComparator(const RankingPolicy& policy);

    // Negative if a sorts first, positive if b sorts first, 0 for a tie.
    int compare(const Candidate& a, const Candidate& b) const;
    int compareWithinTier(const Candidate& a, const Candidate& b) const;

    // Stable. Within a tier and availability group, values more than the gap
    // apart always decide; values inside one cluster never do.
    void sort(std::vector<Candidate>& candidates) const;

    // Cluster id per value (index-aligned), 0 for the cluster that sorts
    // first. Values are walked best-first; a value more than `gap` away from
    // the first value of the current cluster starts the next cluster.
    static std::vector<int> clusterIds(const std::vector<int>& values, int gap,
                                       bool higherFirst);

    static int effectiveFilenameLength(const Candidate& candidate);

private:
    int m_bitrateGap = 0;
    int m_queueGap = 0;
};

} // namespace pt
