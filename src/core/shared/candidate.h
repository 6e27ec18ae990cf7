#pragma once

#include <QString>

#include <cstdint>
#include <optional>

namespace pt {

// Quality tiers; a lower value is a better tier.
enum class Tier {
    Diamond = 1,
    Gold = 2,
    Silver = 3,
    Bronze = 4,
    Trash = 5,
};

QString tierToString(Tier tier);
std::optional<Tier> tierFromString(const QString& name);

// One search result reported by a peer. Input fields are set by the search
// collaborator; only the ranking engine writes the output fields.
struct Candidate {
    QString sourceId;
    QString filename;
    QString format;                      // lower-cased extension: "mp3", "flac", ...
    int bitrateKbps = 0;                 // 0 = unknown
    std::optional<int> lengthSeconds;
    std::optional<int64_t> sizeBytes;
    bool hasFreeCapacity = false;
    int queueDepth = 0;
    std::optional<double> bpm;
    std::optional<QString> musicalKey;

    // Output, written by ResultRanker
    Tier tier = Tier::Trash;
    double rankScore = 0.0;
    QString rankBreakdown;
    int originalIndex = -1;
};

// The track the query originator is looking for.
struct Target {
    QString title;
    QString artist;
    std::optional<int> lengthSeconds;
    std::optional<double> bpm;

    // "<artist> <title>", used as the admission query when the caller has none.
    QString queryText() const;
};

// Derive the lower-cased format from a filename's extension ("" if none).
QString formatFromFilename(const QString& filename);

} // namespace pt
