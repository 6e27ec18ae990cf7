#include "core/ranking/rank_reporter.h"

namespace pt {

double RankReporter::score(Tier tier)
{
    switch (tier) {
    case Tier::Diamond: return 1.0;
    case Tier::Gold:    return 0.85;
    case Tier::Silver:  return 0.60;
    case Tier::Bronze:  return 0.40;
    case Tier::Trash:   return 0.10;
    }
    return 0.10;
}

QString RankReporter::breakdown(Tier tier)
{
    switch (tier) {
    case Tier::Diamond:
        return QStringLiteral("DIAMOND TIER\n- Perfect Match\n- High Quality\n- Available");
    case Tier::Gold:
        return QStringLiteral("GOLD TIER\n- Great Quality\n- Good Availability");
    case Tier::Silver:
        return QStringLiteral("SILVER TIER\n- Acceptable Match");
    case Tier::Bronze:
        return QStringLiteral("BRONZE TIER\n- Low Quality/Availability");
    case Tier::Trash:
        return QStringLiteral("TRASH TIER\n- Forensic Mismatch (possible fake)");
    }
    return QStringLiteral("LOW TIER");
}

void RankReporter::annotate(Candidate& candidate)
{
    candidate.rankScore = score(candidate.tier);
    candidate.rankBreakdown = breakdown(candidate.tier);
}

} // namespace pt
