#include <QtTest/QtTest>

#include "core/forensics/forensic_detector.h"
#include "core/shared/candidate.h"

class TestForensicDetector : public QObject {
    Q_OBJECT

private:
    pt::Candidate makeCandidate(const QString& format, int bitrate, std::optional<int> length,
                                std::optional<int64_t> size = std::nullopt) const
    {
        pt::Candidate c;
        c.sourceId = QStringLiteral("peer");
        c.filename = QStringLiteral("Artist - Title.") + format;
        c.format = format;
        c.bitrateKbps = bitrate;
        c.lengthSeconds = length;
        c.sizeBytes = size;
        return c;
    }

private slots:
    // ── Truncation ───────────────────────────────────────────────
    void testTruncatedAgainstExpectedLength();
    void testModeratelyShorterIsNotFake();
    void testNoExpectedLengthSkipsTruncation();
    void testCustomDurationRatio();

    // ── Bitrate / format plausibility ────────────────────────────
    void testMp3AboveCeiling();
    void testOtherLossyAboveMp3CeilingIsFine();

    // ── Size checks ──────────────────────────────────────────────
    void testMp3TooSmallForBitrate();
    void testMp3SizeMatchesBitrate();
    void testLosslessTooSmall();
    void testLosslessPlausibleSize();

    // ── Misc ─────────────────────────────────────────────────────
    void testUnknownMetadataIsNotFake();
    void testFormatFallsBackToFilename();
    void testAssessment();
};

// ── Truncation ───────────────────────────────────────────────────

void TestForensicDetector::testTruncatedAgainstExpectedLength()
{
    const auto report = pt::ForensicDetector::inspect(makeCandidate("mp3", 320, 60), 300);
    QVERIFY(report.isFake());
    QVERIFY(report.findings.constFirst().startsWith(QStringLiteral("TRUNCATED")));
}

void TestForensicDetector::testModeratelyShorterIsNotFake()
{
    QVERIFY(!pt::ForensicDetector::isFake(makeCandidate("mp3", 320, 200), 300));
    QVERIFY(!pt::ForensicDetector::isFake(makeCandidate("mp3", 320, 150), 300));
}

void TestForensicDetector::testNoExpectedLengthSkipsTruncation()
{
    QVERIFY(!pt::ForensicDetector::isFake(makeCandidate("mp3", 320, 60), std::nullopt));
}

void TestForensicDetector::testCustomDurationRatio()
{
    pt::ForensicThresholds thresholds;
    thresholds.minDurationRatio = 0.9;
    QVERIFY(pt::ForensicDetector::isFake(makeCandidate("mp3", 320, 250), 300, thresholds));
    QVERIFY(!pt::ForensicDetector::isFake(makeCandidate("mp3", 320, 280), 300, thresholds));
}

// ── Bitrate / format plausibility ────────────────────────────────

void TestForensicDetector::testMp3AboveCeiling()
{
    const auto report = pt::ForensicDetector::inspect(makeCandidate("mp3", 448, 300), 300);
    QVERIFY(report.isFake());
    QVERIFY(report.findings.constFirst().contains(QStringLiteral("448")));
}

void TestForensicDetector::testOtherLossyAboveMp3CeilingIsFine()
{
    QVERIFY(!pt::ForensicDetector::isFake(makeCandidate("ogg", 500, 300), 300));
    QVERIFY(!pt::ForensicDetector::isFake(makeCandidate("m4a", 400, 300), 300));
}

// ── Size checks ──────────────────────────────────────────────────

void TestForensicDetector::testMp3TooSmallForBitrate()
{
    // 320 kbps for 300 s is 12,000,000 bytes
    const auto report = pt::ForensicDetector::inspect(
        makeCandidate("mp3", 320, 300, int64_t(5000000)), 300);
    QVERIFY(report.isFake());
    QVERIFY(report.findings.constFirst().startsWith(QStringLiteral("SIZE MISMATCH")));
}

void TestForensicDetector::testMp3SizeMatchesBitrate()
{
    const auto report = pt::ForensicDetector::inspect(
        makeCandidate("mp3", 320, 300, int64_t(12000000)), 300);
    QVERIFY(!report.isFake());
    QVERIFY(report.notes.contains(QStringLiteral("VERIFIED: size matches bitrate")));
}

void TestForensicDetector::testLosslessTooSmall()
{
    // 5 MiB for four minutes of FLAC
    const auto candidate = makeCandidate("flac", 0, 240, int64_t(5) * 1024 * 1024);
    QVERIFY(pt::ForensicDetector::isFake(candidate, 240));
}

void TestForensicDetector::testLosslessPlausibleSize()
{
    const auto candidate = makeCandidate("flac", 900, 240, int64_t(30) * 1024 * 1024);
    const auto report = pt::ForensicDetector::inspect(candidate, 240);
    QVERIFY(!report.isFake());
    QVERIFY(report.notes.contains(QStringLiteral("LOSSLESS: high fidelity format")));
}

// ── Misc ─────────────────────────────────────────────────────────

void TestForensicDetector::testUnknownMetadataIsNotFake()
{
    pt::Candidate bare;
    QVERIFY(!pt::ForensicDetector::isFake(bare, 300));
    QVERIFY(!pt::ForensicDetector::isFake(makeCandidate("mp3", 0, std::nullopt), 300));
}

void TestForensicDetector::testFormatFallsBackToFilename()
{
    pt::Candidate c;
    c.filename = QStringLiteral("Some Track.FLAC");
    QCOMPARE(pt::ForensicDetector::effectiveFormat(c), QStringLiteral("flac"));

    c.format = QStringLiteral(".WAV");
    QCOMPARE(pt::ForensicDetector::effectiveFormat(c), QStringLiteral("wav"));
    QVERIFY(pt::ForensicDetector::isLosslessFormat(QStringLiteral("wav")));
    QVERIFY(!pt::ForensicDetector::isLosslessFormat(QStringLiteral("mp3")));
}

void TestForensicDetector::testAssessment()
{
    pt::ForensicReport empty;
    QCOMPARE(empty.assessment(), QStringLiteral("Standard result"));

    auto candidate = makeCandidate("mp3", 320, 60);
    candidate.hasFreeCapacity = true;
    const auto report = pt::ForensicDetector::inspect(candidate, 300);
    QVERIFY(report.assessment().startsWith(QStringLiteral("TRUNCATED")));
    QVERIFY(report.assessment().endsWith(QStringLiteral("INSTANT: slot available now")));
}

QTEST_MAIN(TestForensicDetector)
#include "test_forensic_detector.moc"
