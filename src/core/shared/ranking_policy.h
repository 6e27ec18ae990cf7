#pragma once

#include <QSet>
#include <QString>

#include <optional>

namespace pt {

enum class RankingPriority {
    QualityFirst, // bitrate, format and integrity first
    DjReady,      // BPM/key metadata and tempo compatibility first
};

QString priorityToString(RankingPriority priority);
std::optional<RankingPriority> priorityFromString(const QString& name);

// Forensic thresholds. Each ratio is a lower bound relative to what the
// declared metadata implies.
struct ForensicThresholds {
    double minDurationRatio = 0.5;         // candidate length / target length
    int maxMp3BitrateKbps = 320;           // MPEG-1 Layer III ceiling
    double minMp3SizeRatio = 0.75;         // actual / expected bytes at >= 320 kbps
    double minLosslessMbPerMinute = 2.5;   // MiB per minute of lossless audio
};

// Ranking Policy value object. Read-only during a ranking call; ResultRanker
// keeps its own copy.
struct RankingPolicy {
    RankingPriority priority = RankingPriority::QualityFirst;

    // Safety gates
    bool enforceDurationMatch = true;
    int durationToleranceSeconds = 4;
    bool enforceStrictTitleMatch = true;
    bool fuzzyTokenNormalization = true;
    int minimumBitrateKbps = 0;            // 0 = no floor
    QSet<QString> blockedSources;

    // Tie-break thresholds
    int significantBitrateGapKbps = 64;
    int significantQueueGap = 5;

    // Classification
    double bpmTolerance = 3.0;
    bool enforceFileIntegrity = true;
    ForensicThresholds forensics;

    static RankingPolicy qualityFirst();
    static RankingPolicy djReady();

    // Returns false and fills error (if non-null) when a parameter is out of range.
    bool validate(QString* error = nullptr) const;
};

} // namespace pt
