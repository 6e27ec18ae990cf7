#include "core/ranking/result_ranker.h"
#include "core/ranking/rank_reporter.h"
#include "core/ranking/tier_classifier.h"
#include "core/ranking/tier_comparator.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>
#include <system_error>
#include <thread>

namespace pt {

ResultRanker::ResultRanker(const RankingPolicy& policy)
    : m_policy(policy)
{
}

std::unique_ptr<ResultRanker> ResultRanker::create(const RankingPolicy& policy, QString* error)
{
    QString reason;
    if (!policy.validate(&reason)) {
        LOG_WARN(ptRanking, "Refusing invalid ranking policy: %s", qUtf8Printable(reason));
        if (error) {
            *error = reason;
        }
        return nullptr;
    }
    return std::unique_ptr<ResultRanker>(new ResultRanker(policy));
}

size_t ResultRanker::computeWorkerCount(size_t batchSize)
{
    if (batchSize < kParallelThreshold) {
        return 1;
    }
    const unsigned hw = std::thread::hardware_concurrency();
    if (hw == 0) {
        return 2;
    }
    const size_t bySize = batchSize / (kParallelThreshold / 2);
    return std::clamp<size_t>(std::min<size_t>(hw, bySize), 1, kMaxWorkers);
}

void ResultRanker::evaluateRange(const std::vector<Candidate>& batch,
                                 std::vector<Evaluation>& out, size_t begin, size_t end,
                                 const SafetyFilter& filter, const TierClassifier& classifier,
                                 const QString& queryText, const Target& target) const
{
    for (size_t i = begin; i < end; ++i) {
        Evaluation& evaluation = out[i];
        evaluation.rejection = filter.evaluate(batch[i], queryText, target.lengthSeconds);
        if (evaluation.rejection == RejectionReason::None) {
            evaluation.tier = classifier.classify(batch[i]);
        }
    }
}

RankingOutcome ResultRanker::rank(std::vector<Candidate> batch, const Target& target,
                                  const QString& queryText) const
{
    QElapsedTimer timer;
    timer.start();

    const QString query = queryText.trimmed().isEmpty() ? target.queryText() : queryText;
    const SafetyFilter filter(m_policy);
    const TierClassifier classifier(m_policy, target);

    for (size_t i = 0; i < batch.size(); ++i) {
        batch[i].originalIndex = static_cast<int>(i);
    }

    // Map: each slice writes only its own range of `evaluations`
    std::vector<Evaluation> evaluations(batch.size());
    const size_t workers = computeWorkerCount(batch.size());
    const size_t sliceSize = workers > 0 ? (batch.size() + workers - 1) / workers : batch.size();

    std::vector<std::thread> threads;
    size_t nextBegin = 0;
    if (workers > 1) {
        threads.reserve(workers - 1);
        try {
            for (size_t w = 0; w + 1 < workers && nextBegin < batch.size(); ++w) {
                const size_t begin = nextBegin;
                const size_t end = std::min(batch.size(), begin + sliceSize);
                threads.emplace_back([&, begin, end]() {
                    evaluateRange(batch, evaluations, begin, end, filter, classifier, query,
                                  target);
                });
                nextBegin = end;
            }
        } catch (const std::system_error& e) {
            LOG_WARN(ptRanking, "rank: could not start worker thread (%s), continuing inline",
                     e.what());
        }
    }
    evaluateRange(batch, evaluations, nextBegin, batch.size(), filter, classifier, query,
                  target);
    for (std::thread& thread : threads) {
        thread.join();
    }

    // Fan-in
    RankingOutcome outcome;
    outcome.ranked.reserve(batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
        const Evaluation& evaluation = evaluations[i];
        if (evaluation.rejection != RejectionReason::None) {
            outcome.rejections.record(evaluation.rejection);
            continue;
        }
        Candidate& candidate = batch[i];
        candidate.tier = evaluation.tier;
        outcome.tierCounts[static_cast<size_t>(evaluation.tier) - 1] += 1;
        outcome.ranked.push_back(std::move(candidate));
    }
    outcome.trashCount = outcome.countForTier(Tier::Trash);

    TierComparator(m_policy).sort(outcome.ranked);

    for (Candidate& candidate : outcome.ranked) {
        RankReporter::annotate(candidate);
    }

    LOG_INFO(ptRanking,
             "rank: %zu candidates, %zu ranked, %d rejected, %d trash (%zu workers, %lld ms)",
             batch.size(), outcome.ranked.size(), outcome.rejectedCount(), outcome.trashCount,
             workers, static_cast<long long>(timer.elapsed()));

    return outcome;
}

} // namespace pt
