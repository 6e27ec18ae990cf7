#include "core/ranking/ranking_json.h"
#include "core/ranking/result_ranker.h"
#include "core/shared/logging.h"
#include "core/shared/policy_store.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QTextStream>

#include <cstdio>
#include <memory>
#include <optional>
#include <vector>

namespace {

bool readDocument(const QString& path, QJsonObject* out, QString* error)
{
    QFile file;
    bool opened = false;
    if (path == QLatin1String("-")) {
        opened = file.open(stdin, QIODevice::ReadOnly);
    } else {
        file.setFileName(path);
        opened = file.open(QIODevice::ReadOnly);
    }
    if (!opened) {
        *error = QStringLiteral("cannot open %1").arg(path);
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        *error = QStringLiteral("invalid JSON in %1: %2").arg(path, parseError.errorString());
        return false;
    }
    *out = doc.object();
    return true;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("peertier-rank"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Rank peer search results against a target track."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption presetOption(
        QStringLiteral("preset"),
        QStringLiteral("Base policy: qualityFirst or djReady."),
        QStringLiteral("name"), QStringLiteral("qualityFirst"));
    const QCommandLineOption policyOption(
        QStringLiteral("policy"),
        QStringLiteral("Policy JSON file; overrides --preset and the stored policy."),
        QStringLiteral("file"));
    parser.addOption(presetOption);
    parser.addOption(policyOption);
    parser.addPositionalArgument(
        QStringLiteral("input"),
        QStringLiteral("JSON with \"target\", \"candidates\" and optional \"query\" ('-' for stdin)."));
    parser.process(app);

    QTextStream err(stderr);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        err << "expected exactly one input file\n";
        return 1;
    }

    // Policy: explicit file > stored policy (unless --preset given) > preset
    QString error;
    std::optional<pt::RankingPolicy> policy;
    if (parser.isSet(policyOption)) {
        policy = pt::PolicyStore::loadFromFile(parser.value(policyOption), &error);
    } else if (!parser.isSet(presetOption)) {
        policy = pt::PolicyStore::load();
    }
    if (!policy && error.isEmpty()) {
        QJsonObject presetJson;
        presetJson.insert(QStringLiteral("preset"), parser.value(presetOption));
        policy = pt::PolicyStore::fromJson(presetJson, &error);
    }
    if (!policy) {
        err << "invalid policy: " << error << '\n';
        return 1;
    }

    const std::unique_ptr<pt::ResultRanker> ranker = pt::ResultRanker::create(*policy, &error);
    if (!ranker) {
        err << "invalid policy: " << error << '\n';
        return 1;
    }

    QJsonObject input;
    if (!readDocument(positional.constFirst(), &input, &error)) {
        err << error << '\n';
        return 1;
    }

    const pt::Target target = pt::targetFromJson(input.value(QStringLiteral("target")).toObject());
    std::vector<pt::Candidate> batch;
    const QJsonArray candidates = input.value(QStringLiteral("candidates")).toArray();
    batch.reserve(static_cast<size_t>(candidates.size()));
    for (const QJsonValue& value : candidates) {
        batch.push_back(pt::candidateFromJson(value.toObject()));
    }

    LOG_INFO(ptCore, "peertier-rank: %lld candidates, priority=%s",
             static_cast<long long>(batch.size()),
             qUtf8Printable(pt::priorityToString(policy->priority)));

    const pt::RankingOutcome outcome =
        ranker->rank(std::move(batch), target, input.value(QStringLiteral("query")).toString());

    QTextStream out(stdout);
    out << QJsonDocument(pt::outcomeToJson(outcome)).toJson(QJsonDocument::Indented);
    return 0;
}
