#include "core/shared/ranking_policy.h"

namespace pt {

QString priorityToString(RankingPriority priority)
{
    switch (priority) {
    case RankingPriority::QualityFirst: return QStringLiteral("qualityFirst");
    case RankingPriority::DjReady:      return QStringLiteral("djReady");
    }
    return QStringLiteral("unknown");
}

std::optional<RankingPriority> priorityFromString(const QString& name)
{
    const QString lowered = name.trimmed().toLower();
    if (lowered == QLatin1String("qualityfirst") || lowered == QLatin1String("quality")) {
        return RankingPriority::QualityFirst;
    }
    if (lowered == QLatin1String("djready") || lowered == QLatin1String("dj")) {
        return RankingPriority::DjReady;
    }
    return std::nullopt;
}

RankingPolicy RankingPolicy::qualityFirst()
{
    return RankingPolicy{};
}

RankingPolicy RankingPolicy::djReady()
{
    RankingPolicy policy;
    policy.priority = RankingPriority::DjReady;
    // Extended mixes and radio edits of the same track differ by more than a few seconds
    policy.durationToleranceSeconds = 15;
    return policy;
}

namespace {

bool fail(QString* error, const QString& message)
{
    if (error) {
        *error = message;
    }
    return false;
}

} // namespace

bool RankingPolicy::validate(QString* error) const
{
    if (durationToleranceSeconds < 0) {
        return fail(error, QStringLiteral("durationToleranceSeconds must be >= 0 (got %1)")
                               .arg(durationToleranceSeconds));
    }
    if (significantBitrateGapKbps < 0) {
        return fail(error, QStringLiteral("significantBitrateGapKbps must be >= 0 (got %1)")
                               .arg(significantBitrateGapKbps));
    }
    if (significantQueueGap < 0) {
        return fail(error, QStringLiteral("significantQueueGap must be >= 0 (got %1)")
                               .arg(significantQueueGap));
    }
    if (minimumBitrateKbps < 0) {
        return fail(error, QStringLiteral("minimumBitrateKbps must be >= 0 (got %1)")
                               .arg(minimumBitrateKbps));
    }
    if (!(bpmTolerance > 0.0)) {
        return fail(error, QStringLiteral("bpmTolerance must be > 0 (got %1)").arg(bpmTolerance));
    }
    if (!(forensics.minDurationRatio > 0.0 && forensics.minDurationRatio <= 1.0)) {
        return fail(error, QStringLiteral("forensics.minDurationRatio must be in (0, 1] (got %1)")
                               .arg(forensics.minDurationRatio));
    }
    if (!(forensics.minMp3SizeRatio > 0.0 && forensics.minMp3SizeRatio <= 1.0)) {
        return fail(error, QStringLiteral("forensics.minMp3SizeRatio must be in (0, 1] (got %1)")
                               .arg(forensics.minMp3SizeRatio));
    }
    if (forensics.maxMp3BitrateKbps <= 0) {
        return fail(error, QStringLiteral("forensics.maxMp3BitrateKbps must be > 0 (got %1)")
                               .arg(forensics.maxMp3BitrateKbps));
    }
    if (!(forensics.minLosslessMbPerMinute > 0.0)) {
        return fail(error, QStringLiteral("forensics.minLosslessMbPerMinute must be > 0 (got %1)")
                               .arg(forensics.minLosslessMbPerMinute));
    }
    return true;
}

} // namespace pt
