#pragma once

#include <QDate>
#include <QDateTime>
#include <QHashFunctions>
#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <optional>
#include <vector>

namespace kvital {

enum class ScoreKind {
    Recovery,
    Sleep
};

const std::vector<ScoreKind> &allScoreKinds();

// Failure taxonomy. Only DurableWriteFailed is ever reported upward; the
// rest degrade a single component or are resolved internally.
enum class ScoreError {
    None,
    InsufficientBaseline,
    MissingSample,
    DurableWriteFailed,
    ConcurrentRecomputeRace
};

struct ScoreComponent
{
    QString     name;
    double      weight = 0.0;
    double      normalizedValue = 0.0;   // 0..100
    double      contribution = 0.0;      // weight * normalizedValue
    QJsonObject rawInputs;
    bool        complete = false;
    ScoreError  degradation = ScoreError::None;
    QString     description;

    bool operator==(const ScoreComponent &other) const;
    bool operator!=(const ScoreComponent &other) const { return !(*this == other); }
};

struct CompositeScore
{
    ScoreKind kind = ScoreKind::Recovery;
    QDate     day;
    int       overall = 0;
    std::vector<ScoreComponent> components;
    QDateTime computedAt;
    bool      dataComplete = false;

    bool operator==(const CompositeScore &other) const;
    bool operator!=(const CompositeScore &other) const { return !(*this == other); }

    const ScoreComponent *component(const QString &name) const;
};

struct ScoreKey
{
    QDate     day;
    ScoreKind kind = ScoreKind::Recovery;

    bool operator==(const ScoreKey &other) const
    {
        return day == other.day && kind == other.kind;
    }
    bool operator!=(const ScoreKey &other) const { return !(*this == other); }
    bool operator<(const ScoreKey &other) const
    {
        return day == other.day ? kind < other.kind : day < other.day;
    }
};

inline size_t qHash(const ScoreKey &key, size_t seed = 0) noexcept
{
    return qHashMulti(seed, key.day, static_cast<int>(key.kind));
}

inline ScoreKey keyOf(const CompositeScore &score)
{
    return ScoreKey{score.day, score.kind};
}

// String conversions
QString scoreKindToString(ScoreKind kind);
std::optional<ScoreKind> scoreKindFromString(const QString &s);

QString scoreErrorToString(ScoreError error);
ScoreError scoreErrorFromString(const QString &s);

QString scoreKeyToString(const ScoreKey &key);

// JSON helpers
QJsonObject componentToJson(const ScoreComponent &component);
ScoreComponent componentFromJson(const QJsonObject &obj);

QJsonObject scoreToJson(const CompositeScore &score);
std::optional<CompositeScore> scoreFromJson(const QJsonObject &obj);

QString scoreToJsonString(const CompositeScore &score);
std::optional<CompositeScore> scoreFromJsonString(const QString &json);

} // namespace kvital

Q_DECLARE_METATYPE(kvital::ScoreKey)
Q_DECLARE_METATYPE(kvital::CompositeScore)
