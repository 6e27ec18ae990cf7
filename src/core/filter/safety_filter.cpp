#include "core/filter/safety_filter.h"
#include "core/query/query_tokenizer.h"
#include "core/shared/logging.h"

#include <cstdlib>

namespace pt {

QString rejectionReasonToString(RejectionReason reason)
{
    switch (reason) {
    case RejectionReason::None:              return QStringLiteral("none");
    case RejectionReason::BlockedSource:     return QStringLiteral("blockedSource");
    case RejectionReason::DurationMismatch:  return QStringLiteral("durationMismatch");
    case RejectionReason::BelowBitrateFloor: return QStringLiteral("belowBitrateFloor");
    case RejectionReason::TokenMismatch:     return QStringLiteral("tokenMismatch");
    }
    return QStringLiteral("unknown");
}

void RejectionStats::record(RejectionReason reason)
{
    switch (reason) {
    case RejectionReason::None:              break;
    case RejectionReason::BlockedSource:     ++blockedSource; break;
    case RejectionReason::DurationMismatch:  ++durationMismatch; break;
    case RejectionReason::BelowBitrateFloor: ++belowBitrateFloor; break;
    case RejectionReason::TokenMismatch:     ++tokenMismatch; break;
    }
}

int RejectionStats::total() const
{
    return blockedSource + durationMismatch + belowBitrateFloor + tokenMismatch;
}

SafetyFilter::SafetyFilter(const RankingPolicy& policy)
    : m_policy(policy)
{
}

bool SafetyFilter::exceedsDurationTolerance(const Candidate& candidate,
                                            std::optional<int> targetLengthSeconds,
                                            const RankingPolicy& policy)
{
    if (!policy.enforceDurationMatch) {
        return false;
    }
    if (!candidate.lengthSeconds.has_value() || !targetLengthSeconds.has_value()) {
        return false;
    }
    if (*candidate.lengthSeconds <= 0 || *targetLengthSeconds <= 0) {
        return false;
    }
    return std::abs(*candidate.lengthSeconds - *targetLengthSeconds)
           > policy.durationToleranceSeconds;
}

RejectionReason SafetyFilter::evaluate(const Candidate& candidate, const QString& queryText,
                                       std::optional<int> targetLengthSeconds) const
{
    // 1. Ban list
    if (m_policy.blockedSources.contains(candidate.sourceId)) {
        LOG_DEBUG(ptFilter, "reject: blocked source '%s' file='%s'",
                  qUtf8Printable(candidate.sourceId), qUtf8Printable(candidate.filename));
        return RejectionReason::BlockedSource;
    }

    // 2. Duration gate
    if (exceedsDurationTolerance(candidate, targetLengthSeconds, m_policy)) {
        LOG_DEBUG(ptFilter, "reject: duration %ds vs target %ds (tolerance %ds) file='%s'",
                  *candidate.lengthSeconds, *targetLengthSeconds,
                  m_policy.durationToleranceSeconds, qUtf8Printable(candidate.filename));
        return RejectionReason::DurationMismatch;
    }

    // 3. Bitrate floor; unknown bitrate passes
    if (m_policy.minimumBitrateKbps > 0 && candidate.bitrateKbps > 0
        && candidate.bitrateKbps < m_policy.minimumBitrateKbps) {
        LOG_DEBUG(ptFilter, "reject: bitrate %d below floor %d file='%s'",
                  candidate.bitrateKbps, m_policy.minimumBitrateKbps,
                  qUtf8Printable(candidate.filename));
        return RejectionReason::BelowBitrateFloor;
    }

    // 4. Token admission: every query token must appear in the filename
    if (m_policy.enforceStrictTitleMatch
        && !QueryTokenizer::matchesAllTokens(queryText, candidate.filename,
                                             m_policy.fuzzyTokenNormalization)) {
        LOG_DEBUG(ptFilter, "reject: token mismatch query='%s' file='%s'",
                  qUtf8Printable(queryText), qUtf8Printable(candidate.filename));
        return RejectionReason::TokenMismatch;
    }

    return RejectionReason::None;
}

} // namespace pt
