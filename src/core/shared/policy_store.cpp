#include "core/shared/policy_store.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

#include <algorithm>
#include <cmath>
#include <limits>

namespace pt {

namespace {

bool fail(QString* error, const QString& message)
{
    if (error) {
        *error = message;
    }
    return false;
}

// Reads json[key] into *out if present. A present value of the wrong type is an error.
bool readBool(const QJsonObject& json, const QString& key, bool* out, QString* error)
{
    if (!json.contains(key)) {
        return true;
    }
    const QJsonValue value = json.value(key);
    if (!value.isBool()) {
        return fail(error, QStringLiteral("'%1' must be a boolean").arg(key));
    }
    *out = value.toBool();
    return true;
}

bool readInt(const QJsonObject& json, const QString& key, int* out, QString* error)
{
    if (!json.contains(key)) {
        return true;
    }
    const QJsonValue value = json.value(key);
    if (!value.isDouble()) {
        return fail(error, QStringLiteral("'%1' must be a number").arg(key));
    }
    const double raw = value.toDouble();
    if (raw < static_cast<double>(std::numeric_limits<int>::min())
        || raw > static_cast<double>(std::numeric_limits<int>::max())
        || raw != std::trunc(raw)) {
        return fail(error, QStringLiteral("'%1' must be an integer in range").arg(key));
    }
    *out = static_cast<int>(raw);
    return true;
}

bool readDouble(const QJsonObject& json, const QString& key, double* out, QString* error)
{
    if (!json.contains(key)) {
        return true;
    }
    const QJsonValue value = json.value(key);
    if (!value.isDouble()) {
        return fail(error, QStringLiteral("'%1' must be a number").arg(key));
    }
    *out = value.toDouble();
    return true;
}

} // namespace

std::optional<RankingPolicy> PolicyStore::load()
{
    const QString filePath = policyFilePath();
    if (!QFile::exists(filePath)) {
        return std::nullopt;
    }

    QString error;
    std::optional<RankingPolicy> policy = loadFromFile(filePath, &error);
    if (!policy) {
        LOG_WARN(ptCore, "Ignoring ranking policy at %s: %s",
                 qUtf8Printable(filePath), qUtf8Printable(error));
    }
    return policy;
}

std::optional<RankingPolicy> PolicyStore::loadFromFile(const QString& filePath, QString* error)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        fail(error, QStringLiteral("cannot open %1 for reading").arg(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        fail(error, QStringLiteral("invalid JSON in %1: %2")
                        .arg(filePath, parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object(), error);
}

bool PolicyStore::save(const RankingPolicy& policy, QString* error)
{
    return saveToFile(policy, policyFilePath(), error);
}

bool PolicyStore::saveToFile(const RankingPolicy& policy, const QString& filePath,
                             QString* error)
{
    // Only policies that load back are stored
    QString reason;
    if (!policy.validate(&reason)) {
        LOG_WARN(ptCore, "Not saving ranking policy to %s: %s",
                 qUtf8Printable(filePath), qUtf8Printable(reason));
        return fail(error, reason);
    }

    if (!QDir().mkpath(QFileInfo(filePath).absolutePath())) {
        return fail(error, QStringLiteral("cannot create directory for %1").arg(filePath));
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return fail(error, QStringLiteral("cannot open %1 for writing").arg(filePath));
    }
    file.write(QJsonDocument(toJson(policy)).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        return fail(error, QStringLiteral("cannot write %1: %2").arg(filePath, file.errorString()));
    }

    LOG_INFO(ptCore, "Saved %s ranking policy to %s",
             qUtf8Printable(priorityToString(policy.priority)), qUtf8Printable(filePath));
    return true;
}

QString PolicyStore::policyFilePath()
{
    const QString overridePath = qEnvironmentVariable("PEERTIER_POLICY_FILE").trimmed();
    if (!overridePath.isEmpty()) {
        return overridePath;
    }
    return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
           + QStringLiteral("/peertier/ranking_policy.json");
}

QJsonObject PolicyStore::toJson(const RankingPolicy& policy)
{
    QStringList blocked(policy.blockedSources.begin(), policy.blockedSources.end());
    std::sort(blocked.begin(), blocked.end());

    QJsonObject forensics;
    forensics.insert(QStringLiteral("minDurationRatio"), policy.forensics.minDurationRatio);
    forensics.insert(QStringLiteral("maxMp3BitrateKbps"), policy.forensics.maxMp3BitrateKbps);
    forensics.insert(QStringLiteral("minMp3SizeRatio"), policy.forensics.minMp3SizeRatio);
    forensics.insert(QStringLiteral("minLosslessMbPerMinute"),
                     policy.forensics.minLosslessMbPerMinute);

    QJsonObject json;
    json.insert(QStringLiteral("priority"), priorityToString(policy.priority));
    json.insert(QStringLiteral("enforceDurationMatch"), policy.enforceDurationMatch);
    json.insert(QStringLiteral("durationToleranceSeconds"), policy.durationToleranceSeconds);
    json.insert(QStringLiteral("enforceStrictTitleMatch"), policy.enforceStrictTitleMatch);
    json.insert(QStringLiteral("fuzzyTokenNormalization"), policy.fuzzyTokenNormalization);
    json.insert(QStringLiteral("minimumBitrateKbps"), policy.minimumBitrateKbps);
    json.insert(QStringLiteral("blockedSources"), QJsonArray::fromStringList(blocked));
    json.insert(QStringLiteral("significantBitrateGapKbps"), policy.significantBitrateGapKbps);
    json.insert(QStringLiteral("significantQueueGap"), policy.significantQueueGap);
    json.insert(QStringLiteral("bpmTolerance"), policy.bpmTolerance);
    json.insert(QStringLiteral("enforceFileIntegrity"), policy.enforceFileIntegrity);
    json.insert(QStringLiteral("forensics"), forensics);
    return json;
}

std::optional<RankingPolicy> PolicyStore::fromJson(const QJsonObject& json, QString* error)
{
    RankingPolicy policy;

    if (json.contains(QStringLiteral("preset"))) {
        const QString preset = json.value(QStringLiteral("preset")).toString();
        const std::optional<RankingPriority> base = priorityFromString(preset);
        if (!base) {
            fail(error, QStringLiteral("unknown preset '%1'").arg(preset));
            return std::nullopt;
        }
        policy = (*base == RankingPriority::DjReady) ? RankingPolicy::djReady()
                                                     : RankingPolicy::qualityFirst();
    }

    if (json.contains(QStringLiteral("priority"))) {
        const QString name = json.value(QStringLiteral("priority")).toString();
        const std::optional<RankingPriority> priority = priorityFromString(name);
        if (!priority) {
            fail(error, QStringLiteral("unknown priority '%1'").arg(name));
            return std::nullopt;
        }
        policy.priority = *priority;
    }

    const bool scalarsOk =
        readBool(json, QStringLiteral("enforceDurationMatch"), &policy.enforceDurationMatch, error)
        && readInt(json, QStringLiteral("durationToleranceSeconds"),
                   &policy.durationToleranceSeconds, error)
        && readBool(json, QStringLiteral("enforceStrictTitleMatch"),
                    &policy.enforceStrictTitleMatch, error)
        && readBool(json, QStringLiteral("fuzzyTokenNormalization"),
                    &policy.fuzzyTokenNormalization, error)
        && readInt(json, QStringLiteral("minimumBitrateKbps"), &policy.minimumBitrateKbps, error)
        && readInt(json, QStringLiteral("significantBitrateGapKbps"),
                   &policy.significantBitrateGapKbps, error)
        && readInt(json, QStringLiteral("significantQueueGap"), &policy.significantQueueGap, error)
        && readDouble(json, QStringLiteral("bpmTolerance"), &policy.bpmTolerance, error)
        && readBool(json, QStringLiteral("enforceFileIntegrity"),
                    &policy.enforceFileIntegrity, error);
    if (!scalarsOk) {
        return std::nullopt;
    }

    if (json.contains(QStringLiteral("blockedSources"))) {
        const QJsonValue value = json.value(QStringLiteral("blockedSources"));
        if (!value.isArray()) {
            fail(error, QStringLiteral("'blockedSources' must be an array of strings"));
            return std::nullopt;
        }
        policy.blockedSources.clear();
        for (const QJsonValue& entry : value.toArray()) {
            if (!entry.isString()) {
                fail(error, QStringLiteral("'blockedSources' must be an array of strings"));
                return std::nullopt;
            }
            policy.blockedSources.insert(entry.toString());
        }
    }

    if (json.contains(QStringLiteral("forensics"))) {
        const QJsonObject forensics = json.value(QStringLiteral("forensics")).toObject();
        ForensicThresholds& t = policy.forensics;
        const bool forensicsOk =
            readDouble(forensics, QStringLiteral("minDurationRatio"), &t.minDurationRatio, error)
            && readInt(forensics, QStringLiteral("maxMp3BitrateKbps"),
                       &t.maxMp3BitrateKbps, error)
            && readDouble(forensics, QStringLiteral("minMp3SizeRatio"),
                          &t.minMp3SizeRatio, error)
            && readDouble(forensics, QStringLiteral("minLosslessMbPerMinute"),
                          &t.minLosslessMbPerMinute, error);
        if (!forensicsOk) {
            return std::nullopt;
        }
    }

    if (!policy.validate(error)) {
        return std::nullopt;
    }
    return policy;
}

} // namespace pt
