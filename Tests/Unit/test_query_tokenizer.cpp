#include <QtTest/QtTest>

#include "core/query/query_tokenizer.h"

class TestQueryTokenizer : public QObject {
    Q_OBJECT

private slots:
    // ── tokenize() ───────────────────────────────────────────────
    void testTokenize_data();
    void testTokenize();
    void testBlankInputHasNoTokens();
    void testDottedWordIsNotAnExtension();
    void testJoinersKeptWithoutFuzzy();
    void testJoinersAreWholeWordOnly();

    // ── matchesAllTokens() ───────────────────────────────────────
    void testExactFilenameMatches();
    void testDifferentTitleRejected();
    void testEmptyQueryMatchesAnything();
    void testBlankCandidateRejected();
    void testTokenOrderIrrelevant();
    void testPartialTokenDoesNotMatch();
    void testFeaturedArtistFuzzy();
    void testFeaturedArtistStrict();
};

// ── tokenize() ───────────────────────────────────────────────────

void TestQueryTokenizer::testTokenize_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<QStringList>("expected");

    QTest::newRow("artist-title-extension")
        << QStringLiteral("Daft Punk - One More Time.mp3")
        << QStringList{"daft", "punk", "one", "more", "time"};
    QTest::newRow("flac-extension")
        << QStringLiteral("Track.FLAC")
        << QStringList{"track"};
    QTest::newRow("delimiters")
        << QStringLiteral("A_B,C[D](E)  F")
        << QStringList{"a", "b", "c", "d", "e", "f"};
    QTest::newRow("short-words-kept")
        << QStringLiteral("The A Team")
        << QStringList{"the", "a", "team"};
    QTest::newRow("featuring-removed")
        << QStringLiteral("Song Title (feat. Artist B)")
        << QStringList{"song", "title", "artist", "b"};
    QTest::newRow("vs-removed")
        << QStringLiteral("Alpha vs Beta")
        << QStringList{"alpha", "beta"};
}

void TestQueryTokenizer::testTokenize()
{
    QFETCH(QString, input);
    QFETCH(QStringList, expected);
    QCOMPARE(pt::QueryTokenizer::tokenize(input, true), expected);
}

void TestQueryTokenizer::testBlankInputHasNoTokens()
{
    QVERIFY(pt::QueryTokenizer::tokenize(QString(), true).isEmpty());
    QVERIFY(pt::QueryTokenizer::tokenize(QStringLiteral("   "), false).isEmpty());
    QVERIFY(pt::QueryTokenizer::tokenize(QStringLiteral(" - _ , "), true).isEmpty());
}

void TestQueryTokenizer::testDottedWordIsNotAnExtension()
{
    // The dot is far from the end, so nothing is stripped
    QCOMPARE(pt::QueryTokenizer::tokenize(QStringLiteral("Mr. Brightside"), true),
             (QStringList{"mr", "brightside"}));
}

void TestQueryTokenizer::testJoinersKeptWithoutFuzzy()
{
    QCOMPARE(pt::QueryTokenizer::tokenize(QStringLiteral("Song Title (feat. Artist B)"), false),
             (QStringList{"song", "title", "feat", "artist", "b"}));
}

void TestQueryTokenizer::testJoinersAreWholeWordOnly()
{
    QCOMPARE(pt::QueryTokenizer::tokenize(QStringLiteral("Without Me"), true),
             (QStringList{"without", "me"}));
    QCOMPARE(pt::QueryTokenizer::tokenize(QStringLiteral("Swift Production"), true),
             (QStringList{"swift", "production"}));
}

// ── matchesAllTokens() ───────────────────────────────────────────

void TestQueryTokenizer::testExactFilenameMatches()
{
    QVERIFY(pt::QueryTokenizer::matchesAllTokens(QStringLiteral("Test Query"),
                                                 QStringLiteral("Test Query.mp3")));
}

void TestQueryTokenizer::testDifferentTitleRejected()
{
    QVERIFY(!pt::QueryTokenizer::matchesAllTokens(
        QStringLiteral("Artist A Title B"), QStringLiteral("Artist A - Title C.mp3")));
}

void TestQueryTokenizer::testEmptyQueryMatchesAnything()
{
    QVERIFY(pt::QueryTokenizer::matchesAllTokens(QString(), QStringLiteral("anything.mp3")));
    QVERIFY(pt::QueryTokenizer::matchesAllTokens(QStringLiteral("  "), QString()));
}

void TestQueryTokenizer::testBlankCandidateRejected()
{
    QVERIFY(!pt::QueryTokenizer::matchesAllTokens(QStringLiteral("title"), QString()));
    QVERIFY(!pt::QueryTokenizer::matchesAllTokens(QStringLiteral("title"), QStringLiteral("  ")));
}

void TestQueryTokenizer::testTokenOrderIrrelevant()
{
    QVERIFY(pt::QueryTokenizer::matchesAllTokens(QStringLiteral("Title Artist"),
                                                 QStringLiteral("Artist - Title.flac")));
}

void TestQueryTokenizer::testPartialTokenDoesNotMatch()
{
    QVERIFY(!pt::QueryTokenizer::matchesAllTokens(QStringLiteral("one"),
                                                  QStringLiteral("Someone.mp3")));
}

void TestQueryTokenizer::testFeaturedArtistFuzzy()
{
    QVERIFY(pt::QueryTokenizer::matchesAllTokens(
        QStringLiteral("Artist feat Other Title"),
        QStringLiteral("Artist - Title (ft. Other).mp3"), true));
}

void TestQueryTokenizer::testFeaturedArtistStrict()
{
    // "feat" survives in the query and "ft" in the filename
    QVERIFY(!pt::QueryTokenizer::matchesAllTokens(
        QStringLiteral("Artist feat Other Title"),
        QStringLiteral("Artist - Title (ft. Other).mp3"), false));
}

QTEST_MAIN(TestQueryTokenizer)
#include "test_query_tokenizer.moc"
