#pragma once

#include "core/shared/candidate.h"
#include "core/shared/ranking_policy.h"

#include <QString>
#include <QStringList>

#include <optional>

namespace pt {

// Outcome of a forensic inspection. Any finding marks the candidate as a
// likely fake; notes are informational only.
struct ForensicReport {
    QStringList findings;
    QStringList notes;

    bool isFake() const { return !findings.isEmpty(); }

    // Findings then notes joined with " | ", or "Standard result".
    QString assessment() const;
};

// Flags candidates whose declared metadata is internally inconsistent or
// implausible against the expected track length. Pure: the result depends
// only on the arguments.
//
// Rules (thresholds from ForensicThresholds):
//   - truncation:   length < expected * minDurationRatio
//   - overstated:   mp3 declaring more than maxMp3BitrateKbps
//   - mp3 size:     >= 320 kbps mp3 smaller than minMp3SizeRatio of the expected bytes
//   - lossless size: lossless file below minLosslessMbPerMinute
class ForensicDetector {
public:
    static ForensicReport inspect(const Candidate& candidate,
                                  std::optional<int> expectedLengthSeconds,
                                  const ForensicThresholds& thresholds = {});

    static bool isFake(const Candidate& candidate,
                       std::optional<int> expectedLengthSeconds,
                       const ForensicThresholds& thresholds = {})
    {
        return inspect(candidate, expectedLengthSeconds, thresholds).isFake();
    }

    // Lower-cased format, falling back to the filename extension.
    static QString effectiveFormat(const Candidate& candidate);

    static bool isLosslessFormat(const QString& format);
};

} // namespace pt
