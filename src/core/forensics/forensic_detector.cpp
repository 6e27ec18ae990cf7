#include "core/forensics/forensic_detector.h"
#include "core/shared/logging.h"

namespace pt {

namespace {

constexpr double kBytesPerMiB = 1024.0 * 1024.0;

} // namespace

QString ForensicReport::assessment() const
{
    const QStringList all = findings + notes;
    if (all.isEmpty()) {
        return QStringLiteral("Standard result");
    }
    return all.join(QStringLiteral(" | "));
}

QString ForensicDetector::effectiveFormat(const Candidate& candidate)
{
    const QString declared = candidate.format.trimmed().toLower();
    if (!declared.isEmpty()) {
        return declared.startsWith(QLatin1Char('.')) ? declared.mid(1) : declared;
    }
    return formatFromFilename(candidate.filename);
}

bool ForensicDetector::isLosslessFormat(const QString& format)
{
    return format == QLatin1String("flac") || format == QLatin1String("wav")
           || format == QLatin1String("aiff") || format == QLatin1String("aif")
           || format == QLatin1String("alac");
}

ForensicReport ForensicDetector::inspect(const Candidate& candidate,
                                         std::optional<int> expectedLengthSeconds,
                                         const ForensicThresholds& thresholds)
{
    ForensicReport report;

    const QString format = effectiveFormat(candidate);
    const bool isMp3 = format == QLatin1String("mp3");
    const bool isLossless = isLosslessFormat(format);

    const int length = candidate.lengthSeconds.value_or(0);
    const int64_t size = candidate.sizeBytes.value_or(0);
    const int bitrate = candidate.bitrateKbps;

    if (length > 0 && expectedLengthSeconds.value_or(0) > 0) {
        const double floor = *expectedLengthSeconds * thresholds.minDurationRatio;
        if (length < floor) {
            report.findings.append(
                QStringLiteral("TRUNCATED: %1s against an expected %2s")
                    .arg(length)
                    .arg(*expectedLengthSeconds));
        }
    }

    if (isMp3 && bitrate > thresholds.maxMp3BitrateKbps) {
        report.findings.append(
            QStringLiteral("IMPOSSIBLE BITRATE: mp3 declares %1 kbps").arg(bitrate));
    }

    if (isMp3 && bitrate >= 320 && length > 0 && size > 0) {
        const double expectedBytes = (bitrate * 1000.0 / 8.0) * length;
        const double actualBytes = static_cast<double>(size);
        if (actualBytes < expectedBytes * thresholds.minMp3SizeRatio) {
            report.findings.append(
                QStringLiteral("SIZE MISMATCH: file is too small for %1 kbps").arg(bitrate));
        } else if (actualBytes > expectedBytes * 0.90 && actualBytes < expectedBytes * 1.10) {
            report.notes.append(QStringLiteral("VERIFIED: size matches bitrate"));
        }
    }

    if (isLossless && length > 0 && size > 0) {
        const double mbPerMinute = (static_cast<double>(size) / kBytesPerMiB) / (length / 60.0);
        if (mbPerMinute < thresholds.minLosslessMbPerMinute) {
            report.findings.append(
                QStringLiteral("SIZE MISMATCH: %1 MiB/min is too small for lossless")
                    .arg(mbPerMinute, 0, 'f', 2));
        }
    }

    if (isLossless) {
        report.notes.append(QStringLiteral("LOSSLESS: high fidelity format"));
    }
    if (candidate.hasFreeCapacity) {
        report.notes.append(QStringLiteral("INSTANT: slot available now"));
    }

    if (report.isFake()) {
        LOG_DEBUG(ptForensics, "inspect: file='%s' flagged: %s",
                  qUtf8Printable(candidate.filename),
                  qUtf8Printable(report.findings.join(QStringLiteral("; "))));
    }

    return report;
}

} // namespace pt
