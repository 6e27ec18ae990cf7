#pragma once

#include "core/ranking/result_ranker.h"
#include "core/shared/candidate.h"

#include <QJsonObject>

namespace pt {

// JSON shapes used by the peertier-rank tool. Keys are camelCase field names;
// optional fields that are absent stay unset. A missing "format" is derived
// from the filename extension.
Candidate candidateFromJson(const QJsonObject& json);
QJsonObject candidateToJson(const Candidate& candidate);

Target targetFromJson(const QJsonObject& json);
QJsonObject targetToJson(const Target& target);

// { "ranked": [...], "rejected": n, "rejections": {...}, "trash": n, "tiers": {...} }
QJsonObject outcomeToJson(const RankingOutcome& outcome);

} // namespace pt
