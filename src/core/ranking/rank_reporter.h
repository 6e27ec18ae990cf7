#pragma once

#include "core/shared/candidate.h"

#include <QString>

namespace pt {

// Presentation aids for the UI. Never consulted for ordering.
class RankReporter {
public:
    // Diamond 1.0, Gold 0.85, Silver 0.60, Bronze 0.40, Trash 0.10
    static double score(Tier tier);
    static QString breakdown(Tier tier);

    // Writes rankScore and rankBreakdown from candidate.tier.
    static void annotate(Candidate& candidate);
};

} // namespace pt
