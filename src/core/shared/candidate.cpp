#include "core/shared/candidate.h"

#include <algorithm>

namespace pt {

QString tierToString(Tier tier)
{
    switch (tier) {
    case Tier::Diamond: return QStringLiteral("diamond");
    case Tier::Gold:    return QStringLiteral("gold");
    case Tier::Silver:  return QStringLiteral("silver");
    case Tier::Bronze:  return QStringLiteral("bronze");
    case Tier::Trash:   return QStringLiteral("trash");
    }
    return QStringLiteral("unknown");
}

std::optional<Tier> tierFromString(const QString& name)
{
    const QString lowered = name.trimmed().toLower();
    for (Tier tier : {Tier::Diamond, Tier::Gold, Tier::Silver, Tier::Bronze, Tier::Trash}) {
        if (tierToString(tier) == lowered) {
            return tier;
        }
    }
    return std::nullopt;
}

QString Target::queryText() const
{
    return (artist.trimmed() + QLatin1Char(' ') + title.trimmed()).trimmed();
}

QString formatFromFilename(const QString& filename)
{
    const int dot = filename.lastIndexOf(QLatin1Char('.'));
    const int slash = std::max(filename.lastIndexOf(QLatin1Char('/')),
                               filename.lastIndexOf(QLatin1Char('\\')));
    if (dot <= 0 || dot < slash || dot == filename.size() - 1) {
        return {};
    }
    return filename.mid(dot + 1).toLower();
}

} // namespace pt
