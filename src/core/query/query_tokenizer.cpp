#include "core/query/query_tokenizer.h"
#include "core/shared/logging.h"

#include <QRegularExpression>
#include <QSet>

namespace pt {

namespace {

const QRegularExpression& delimiterRegex()
{
    static const QRegularExpression regex(QStringLiteral(R"([\s\-_,\.\(\)\[\]\{\}]+)"));
    return regex;
}

const QRegularExpression& joinerRegex()
{
    static const QRegularExpression regex(
        QStringLiteral(R"(\b(feat|ft|featuring|vs|with|prod)\b)"),
        QRegularExpression::CaseInsensitiveOption);
    return regex;
}

} // namespace

QString QueryTokenizer::stripExtension(const QString& lowered)
{
    const int lastDot = lowered.lastIndexOf(QLatin1Char('.'));
    // ".mp3", ".flac": the dot sits within the last 6 characters
    if (lastDot > 0 && lowered.size() - lastDot < 6) {
        return lowered.left(lastDot);
    }
    return lowered;
}

QStringList QueryTokenizer::tokenize(const QString& text, bool fuzzy)
{
    if (text.trimmed().isEmpty()) {
        return {};
    }

    QString normalized = stripExtension(text.toLower());

    if (fuzzy) {
        normalized.replace(joinerRegex(), QStringLiteral(" "));
    }

    return normalized.split(delimiterRegex(), Qt::SkipEmptyParts);
}

bool QueryTokenizer::matchesAllTokens(const QString& query, const QString& candidateText,
                                      bool fuzzy)
{
    if (query.trimmed().isEmpty()) {
        return true;
    }
    if (candidateText.trimmed().isEmpty()) {
        return false;
    }

    const QStringList queryTokens = tokenize(query, fuzzy);
    const QStringList candidateTokens = tokenize(candidateText, fuzzy);
    const QSet<QString> candidateSet(candidateTokens.begin(), candidateTokens.end());

    for (const QString& token : queryTokens) {
        if (!candidateSet.contains(token)) {
            LOG_DEBUG(ptQuery, "matchesAllTokens: '%s' missing from '%s'",
                      qUtf8Printable(token), qUtf8Printable(candidateText));
            return false;
        }
    }
    return true;
}

} // namespace pt
