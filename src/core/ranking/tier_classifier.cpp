#include "core/ranking/tier_classifier.h"
#include "core/filter/safety_filter.h"
#include "core/forensics/forensic_detector.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace pt {

TierClassifier::TierClassifier(const RankingPolicy& policy, const Target& target)
    : m_policy(policy)
    , m_target(target)
{
    const ForensicThresholds thresholds = policy.forensics;
    m_forensicCheck = [thresholds](const Candidate& candidate,
                                   std::optional<int> expectedLengthSeconds) {
        return ForensicDetector::isFake(candidate, expectedLengthSeconds, thresholds);
    };
}

TierClassifier::TierClassifier(const RankingPolicy& policy, const Target& target,
                               ForensicCheck forensicCheck)
    : m_policy(policy)
    , m_target(target)
    , m_forensicCheck(std::move(forensicCheck))
{
}

bool TierClassifier::hasBpmHint(const Candidate& candidate)
{
    return candidate.bpm.has_value()
           || candidate.filename.contains(QLatin1String("bpm"), Qt::CaseInsensitive);
}

bool TierClassifier::hasKey(const Candidate& candidate)
{
    return candidate.musicalKey.has_value() && !candidate.musicalKey->trimmed().isEmpty();
}

bool TierClassifier::isLossless(const Candidate& candidate)
{
    const QString format = ForensicDetector::effectiveFormat(candidate);
    return format == QLatin1String("flac") || format == QLatin1String("wav");
}

bool TierClassifier::bpmMatches(const Candidate& candidate) const
{
    if (!m_target.bpm.has_value()) {
        return true;
    }
    if (!candidate.bpm.has_value()) {
        return false;
    }
    return std::fabs(*m_target.bpm - *candidate.bpm) < m_policy.bpmTolerance;
}

Tier TierClassifier::classify(const Candidate& candidate) const
{
    // 1. Forensic veto
    if (m_policy.enforceFileIntegrity && m_forensicCheck
        && m_forensicCheck(candidate, m_target.lengthSeconds)) {
        LOG_DEBUG(ptRanking, "classify: Trash (forensic) file='%s'",
                  qUtf8Printable(candidate.filename));
        return Tier::Trash;
    }

    // 2. Availability veto outranks quality
    const int queueDepth = std::max(0, candidate.queueDepth);
    if (!candidate.hasFreeCapacity && queueDepth > kAvailabilityVetoQueueDepth) {
        LOG_DEBUG(ptRanking, "classify: Bronze (queue %d) file='%s'",
                  queueDepth, qUtf8Printable(candidate.filename));
        return Tier::Bronze;
    }

    // 3. Duration gate, normally already applied by SafetyFilter
    if (SafetyFilter::exceedsDurationTolerance(candidate, m_target.lengthSeconds, m_policy)) {
        LOG_DEBUG(ptRanking, "classify: Bronze (duration) file='%s'",
                  qUtf8Printable(candidate.filename));
        return Tier::Bronze;
    }

    // 4. Facts
    const int bitrate = std::max(0, candidate.bitrateKbps);
    const bool lossless = isLossless(candidate);
    const bool isHighQuality = bitrate >= 320 || lossless;
    const bool isMidQuality = bitrate >= 192;

    // 5. Priority table
    if (m_policy.priority == RankingPriority::DjReady) {
        return classifyDjReady(candidate, isHighQuality, isMidQuality);
    }
    return classifyQualityFirst(candidate, lossless, isHighQuality, isMidQuality);
}

Tier TierClassifier::classifyDjReady(const Candidate& candidate, bool isHighQuality,
                                     bool isMidQuality) const
{
    const bool hasMetadata = hasBpmHint(candidate) || hasKey(candidate);
    const bool tempoOk = bpmMatches(candidate);

    if (hasMetadata && tempoOk && isHighQuality && candidate.hasFreeCapacity) {
        return Tier::Diamond;
    }
    if (hasMetadata && tempoOk && isMidQuality) {
        return Tier::Gold;
    }
    if (isMidQuality) {
        return Tier::Silver;
    }
    return Tier::Bronze;
}

Tier TierClassifier::classifyQualityFirst(const Candidate& candidate, bool isLossless,
                                          bool isHighQuality, bool isMidQuality) const
{
    const bool perfectFormat = isLossless || candidate.bitrateKbps == 320;

    if (perfectFormat && candidate.hasFreeCapacity) {
        return Tier::Diamond;
    }
    if (isHighQuality) {
        return Tier::Gold;
    }
    if (isMidQuality) {
        return Tier::Silver;
    }
    return Tier::Bronze;
}

} // namespace pt
