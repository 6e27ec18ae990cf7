#include "core/ranking/tier_comparator.h"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <map>
#include <numeric>
#include <tuple>
#include <utility>

namespace pt {

namespace {

int threeWay(int a, int b)
{
    return (a < b) ? -1 : ((a > b) ? 1 : 0);
}

bool differsBy(int a, int b, int gap)
{
    return std::llabs(static_cast<long long>(a) - static_cast<long long>(b)) > gap;
}

struct SortKey {
    int tier = 0;
    int busy = 0;
    int bitrateCluster = 0;
    int queueCluster = 0;
    int filenameLength = 0;

    bool operator<(const SortKey& other) const
    {
        return std::tie(tier, busy, bitrateCluster, queueCluster, filenameLength)
               < std::tie(other.tier, other.busy, other.bitrateCluster, other.queueCluster,
                          other.filenameLength);
    }
};

} // namespace

TierComparator::TierComparator(const RankingPolicy& policy)
    : m_bitrateGap(std::max(0, policy.significantBitrateGapKbps))
    , m_queueGap(std::max(0, policy.significantQueueGap))
{
}

int TierComparator::effectiveFilenameLength(const Candidate& candidate)
{
    if (candidate.filename.isEmpty()) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(candidate.filename.size());
}

int TierComparator::compare(const Candidate& a, const Candidate& b) const
{
    const int tierOrder = threeWay(static_cast<int>(a.tier), static_cast<int>(b.tier));
    if (tierOrder != 0) {
        return tierOrder;
    }
    return compareWithinTier(a, b);
}

int TierComparator::compareWithinTier(const Candidate& a, const Candidate& b) const
{
    // 1. Availability
    if (a.hasFreeCapacity != b.hasFreeCapacity) {
        return a.hasFreeCapacity ? -1 : 1;
    }

    // 2. Bitrate, descending
    const int bitrateA = std::max(0, a.bitrateKbps);
    const int bitrateB = std::max(0, b.bitrateKbps);
    if (differsBy(bitrateA, bitrateB, m_bitrateGap)) {
        return threeWay(bitrateB, bitrateA);
    }

    // 3. Queue depth, ascending
    const int queueA = std::max(0, a.queueDepth);
    const int queueB = std::max(0, b.queueDepth);
    if (differsBy(queueA, queueB, m_queueGap)) {
        return threeWay(queueA, queueB);
    }

    // 4. Filename length, ascending
    return threeWay(effectiveFilenameLength(a), effectiveFilenameLength(b));
}

std::vector<int> TierComparator::clusterIds(const std::vector<int>& values, int gap,
                                            bool higherFirst)
{
    std::vector<size_t> order(values.size());
    std::iota(order.begin(), order.end(), size_t(0));
    std::stable_sort(order.begin(), order.end(), [&](size_t left, size_t right) {
        return higherFirst ? values[left] > values[right] : values[left] < values[right];
    });

    std::vector<int> ids(values.size(), 0);
    int cluster = -1;
    int anchor = 0;
    for (size_t index : order) {
        const int value = values[index];
        if (cluster < 0 || differsBy(value, anchor, std::max(0, gap))) {
            ++cluster;
            anchor = value;
        }
        ids[index] = cluster;
    }
    return ids;
}

void TierComparator::sort(std::vector<Candidate>& candidates) const
{
    std::vector<SortKey> keys(candidates.size());

    // Bitrate clusters per (tier, availability) group
    std::map<std::pair<int, int>, std::vector<size_t>> groups;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const Candidate& candidate = candidates[i];
        SortKey& key = keys[i];
        key.tier = static_cast<int>(candidate.tier);
        key.busy = candidate.hasFreeCapacity ? 0 : 1;
        key.filenameLength = effectiveFilenameLength(candidate);
        groups[{key.tier, key.busy}].push_back(i);
    }

    for (const auto& [group, members] : groups) {
        std::vector<int> bitrates;
        bitrates.reserve(members.size());
        for (size_t i : members) {
            bitrates.push_back(std::max(0, candidates[i].bitrateKbps));
        }
        const std::vector<int> bitrateIds = clusterIds(bitrates, m_bitrateGap, true);

        // Queue clusters per bitrate cluster
        std::map<int, std::vector<size_t>> byBitrate;
        for (size_t m = 0; m < members.size(); ++m) {
            keys[members[m]].bitrateCluster = bitrateIds[m];
            byBitrate[bitrateIds[m]].push_back(members[m]);
        }
        for (const auto& [cluster, clusterMembers] : byBitrate) {
            std::vector<int> queues;
            queues.reserve(clusterMembers.size());
            for (size_t i : clusterMembers) {
                queues.push_back(std::max(0, candidates[i].queueDepth));
            }
            const std::vector<int> queueIds = clusterIds(queues, m_queueGap, false);
            for (size_t m = 0; m < clusterMembers.size(); ++m) {
                keys[clusterMembers[m]].queueCluster = queueIds[m];
            }
        }
    }

    std::vector<size_t> order(candidates.size());
    std::iota(order.begin(), order.end(), size_t(0));
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t left, size_t right) { return keys[left] < keys[right]; });

    std::vector<Candidate> sorted;
    sorted.reserve(candidates.size());
    for (size_t i : order) {
        sorted.push_back(std::move(candidates[i]));
    }
    candidates = std::move(sorted);
}

} // namespace pt
