#pragma once

#include <QString>
#include <QStringList>

namespace pt {

// Token-based admission gate for peer search results.
class QueryTokenizer {
public:
    // Lowercase, strip a trailing file extension (dot within the last 6
    // characters), optionally drop joining words (feat, ft, featuring, vs,
    // with, prod), then split on whitespace, '-', '_', ',', '.', and
    // brackets. Empty tokens are dropped; short words are kept.
    static QStringList tokenize(const QString& text, bool fuzzy);

    // True iff every query token appears in the candidate's tokens.
    // A blank query matches anything; a blank candidate matches nothing else.
    static bool matchesAllTokens(const QString& query, const QString& candidateText,
                                 bool fuzzy = true);

private:
    static QString stripExtension(const QString& lowered);
};

} // namespace pt
