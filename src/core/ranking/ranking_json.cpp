#include "core/ranking/ranking_json.h"

#include <QJsonArray>

#include <limits>

namespace pt {

namespace {

std::optional<int> optionalInt(const QJsonObject& json, const QString& key)
{
    const QJsonValue value = json.value(key);
    if (!value.isDouble()) {
        return std::nullopt;
    }
    return value.toInt();
}

std::optional<double> optionalDouble(const QJsonObject& json, const QString& key)
{
    const QJsonValue value = json.value(key);
    if (!value.isDouble()) {
        return std::nullopt;
    }
    return value.toDouble();
}

} // namespace

Candidate candidateFromJson(const QJsonObject& json)
{
    Candidate candidate;
    candidate.sourceId = json.value(QStringLiteral("sourceId")).toString();
    candidate.filename = json.value(QStringLiteral("filename")).toString();
    candidate.format = json.value(QStringLiteral("format")).toString().toLower();
    if (candidate.format.isEmpty()) {
        candidate.format = formatFromFilename(candidate.filename);
    }
    candidate.bitrateKbps = json.value(QStringLiteral("bitrateKbps")).toInt(0);
    candidate.lengthSeconds = optionalInt(json, QStringLiteral("lengthSeconds"));

    const QJsonValue size = json.value(QStringLiteral("sizeBytes"));
    if (size.isDouble()) {
        // Out-of-range sizes stay unknown
        const double raw = size.toDouble();
        if (raw >= static_cast<double>(std::numeric_limits<int64_t>::min())
            && raw < static_cast<double>(std::numeric_limits<int64_t>::max())) {
            candidate.sizeBytes = static_cast<int64_t>(raw);
        }
    }

    candidate.hasFreeCapacity = json.value(QStringLiteral("hasFreeCapacity")).toBool(false);
    candidate.queueDepth = json.value(QStringLiteral("queueDepth")).toInt(0);
    candidate.bpm = optionalDouble(json, QStringLiteral("bpm"));

    const QJsonValue key = json.value(QStringLiteral("musicalKey"));
    if (key.isString()) {
        candidate.musicalKey = key.toString();
    }
    return candidate;
}

QJsonObject candidateToJson(const Candidate& candidate)
{
    QJsonObject json;
    json.insert(QStringLiteral("sourceId"), candidate.sourceId);
    json.insert(QStringLiteral("filename"), candidate.filename);
    json.insert(QStringLiteral("format"), candidate.format);
    json.insert(QStringLiteral("bitrateKbps"), candidate.bitrateKbps);
    if (candidate.lengthSeconds) {
        json.insert(QStringLiteral("lengthSeconds"), *candidate.lengthSeconds);
    }
    if (candidate.sizeBytes) {
        json.insert(QStringLiteral("sizeBytes"), static_cast<qint64>(*candidate.sizeBytes));
    }
    json.insert(QStringLiteral("hasFreeCapacity"), candidate.hasFreeCapacity);
    json.insert(QStringLiteral("queueDepth"), candidate.queueDepth);
    if (candidate.bpm) {
        json.insert(QStringLiteral("bpm"), *candidate.bpm);
    }
    if (candidate.musicalKey) {
        json.insert(QStringLiteral("musicalKey"), *candidate.musicalKey);
    }
    json.insert(QStringLiteral("tier"), tierToString(candidate.tier));
    json.insert(QStringLiteral("rankScore"), candidate.rankScore);
    json.insert(QStringLiteral("rankBreakdown"), candidate.rankBreakdown);
    json.insert(QStringLiteral("originalIndex"), candidate.originalIndex);
    return json;
}

Target targetFromJson(const QJsonObject& json)
{
    Target target;
    target.title = json.value(QStringLiteral("title")).toString();
    target.artist = json.value(QStringLiteral("artist")).toString();
    target.lengthSeconds = optionalInt(json, QStringLiteral("lengthSeconds"));
    target.bpm = optionalDouble(json, QStringLiteral("bpm"));
    return target;
}

QJsonObject targetToJson(const Target& target)
{
    QJsonObject json;
    json.insert(QStringLiteral("title"), target.title);
    json.insert(QStringLiteral("artist"), target.artist);
    if (target.lengthSeconds) {
        json.insert(QStringLiteral("lengthSeconds"), *target.lengthSeconds);
    }
    if (target.bpm) {
        json.insert(QStringLiteral("bpm"), *target.bpm);
    }
    return json;
}

QJsonObject outcomeToJson(const RankingOutcome& outcome)
{
    QJsonArray ranked;
    for (const Candidate& candidate : outcome.ranked) {
        ranked.append(candidateToJson(candidate));
    }

    QJsonObject rejections;
    rejections.insert(rejectionReasonToString(RejectionReason::BlockedSource),
                      outcome.rejections.blockedSource);
    rejections.insert(rejectionReasonToString(RejectionReason::DurationMismatch),
                      outcome.rejections.durationMismatch);
    rejections.insert(rejectionReasonToString(RejectionReason::BelowBitrateFloor),
                      outcome.rejections.belowBitrateFloor);
    rejections.insert(rejectionReasonToString(RejectionReason::TokenMismatch),
                      outcome.rejections.tokenMismatch);

    QJsonObject tiers;
    for (Tier tier : {Tier::Diamond, Tier::Gold, Tier::Silver, Tier::Bronze, Tier::Trash}) {
        tiers.insert(tierToString(tier), outcome.countForTier(tier));
    }

    QJsonObject json;
    json.insert(QStringLiteral("ranked"), ranked);
    json.insert(QStringLiteral("rejected"), outcome.rejectedCount());
    json.insert(QStringLiteral("rejections"), rejections);
    json.insert(QStringLiteral("trash"), outcome.trashCount);
    json.insert(QStringLiteral("tiers"), tiers);
    return json;
}

} // namespace pt
