#include "kvital/score.hpp"

#include "kvital/common.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonValue>
#include <QTimeZone>

namespace kvital {

const std::vector<ScoreKind> &allScoreKinds()
{
    static const std::vector<ScoreKind> kinds = {
        ScoreKind::Recovery,
        ScoreKind::Sleep,
    };
    return kinds;
}

bool ScoreComponent::operator==(const ScoreComponent &other) const
{
    return name == other.name
        && weight == other.weight
        && normalizedValue == other.normalizedValue
        && contribution == other.contribution
        && rawInputs == other.rawInputs
        && complete == other.complete
        && degradation == other.degradation
        && description == other.description;
}

bool CompositeScore::operator==(const CompositeScore &other) const
{
    return kind == other.kind
        && day == other.day
        && overall == other.overall
        && components == other.components
        && computedAt == other.computedAt
        && dataComplete == other.dataComplete;
}

const ScoreComponent *CompositeScore::component(const QString &name) const
{
    for (const auto &c : components) {
        if (c.name == name) {
            return &c;
        }
    }
    return nullptr;
}

QString scoreKindToString(ScoreKind kind)
{
    switch (kind) {
    case ScoreKind::Recovery:
        return QStringLiteral("recovery");
    case ScoreKind::Sleep:
        return QStringLiteral("sleep");
    }

    return QStringLiteral("recovery");
}

std::optional<ScoreKind> scoreKindFromString(const QString &s)
{
    const QString lower = s.trimmed().toLower();

    if (lower == QLatin1String("recovery"))
        return ScoreKind::Recovery;
    if (lower == QLatin1String("sleep"))
        return ScoreKind::Sleep;

    return std::nullopt;
}

QString scoreErrorToString(ScoreError error)
{
    switch (error) {
    case ScoreError::None:
        return QStringLiteral("none");
    case ScoreError::InsufficientBaseline:
        return QStringLiteral("insufficient_baseline");
    case ScoreError::MissingSample:
        return QStringLiteral("missing_sample");
    case ScoreError::DurableWriteFailed:
        return QStringLiteral("durable_write_failed");
    case ScoreError::ConcurrentRecomputeRace:
        return QStringLiteral("concurrent_recompute_race");
    }

    return QStringLiteral("none");
}

ScoreError scoreErrorFromString(const QString &s)
{
    const QString lower = s.trimmed().toLower();

    if (lower == QLatin1String("insufficient_baseline"))
        return ScoreError::InsufficientBaseline;
    if (lower == QLatin1String("missing_sample"))
        return ScoreError::MissingSample;
    if (lower == QLatin1String("durable_write_failed"))
        return ScoreError::DurableWriteFailed;
    if (lower == QLatin1String("concurrent_recompute_race"))
        return ScoreError::ConcurrentRecomputeRace;

    return ScoreError::None;
}

QString scoreKeyToString(const ScoreKey &key)
{
    return QStringLiteral("%1/%2").arg(dayToString(key.day), scoreKindToString(key.kind));
}

QJsonObject componentToJson(const ScoreComponent &component)
{
    QJsonObject obj;

    obj.insert(QStringLiteral("name"), component.name);
    obj.insert(QStringLiteral("weight"), component.weight);
    obj.insert(QStringLiteral("normalized"), component.normalizedValue);
    obj.insert(QStringLiteral("contribution"), component.contribution);
    obj.insert(QStringLiteral("complete"), component.complete);

    if (!component.rawInputs.isEmpty()) {
        obj.insert(QStringLiteral("inputs"), component.rawInputs);
    }
    if (component.degradation != ScoreError::None) {
        obj.insert(QStringLiteral("degradation"), scoreErrorToString(component.degradation));
    }
    if (!component.description.isEmpty()) {
        obj.insert(QStringLiteral("description"), component.description);
    }

    return obj;
}

ScoreComponent componentFromJson(const QJsonObject &obj)
{
    ScoreComponent c;

    c.name            = obj.value(QStringLiteral("name")).toString();
    c.weight          = obj.value(QStringLiteral("weight")).toDouble();
    c.normalizedValue = obj.value(QStringLiteral("normalized")).toDouble();
    c.contribution    = obj.value(QStringLiteral("contribution")).toDouble();
    c.complete        = obj.value(QStringLiteral("complete")).toBool();
    c.rawInputs       = obj.value(QStringLiteral("inputs")).toObject();
    c.degradation     = scoreErrorFromString(obj.value(QStringLiteral("degradation")).toString());
    c.description     = obj.value(QStringLiteral("description")).toString();

    return c;
}

QJsonObject scoreToJson(const CompositeScore &score)
{
    QJsonObject obj;

    obj.insert(QStringLiteral("kind"), scoreKindToString(score.kind));
    obj.insert(QStringLiteral("day"), dayToString(score.day));
    obj.insert(QStringLiteral("overall"), score.overall);
    obj.insert(QStringLiteral("data_complete"), score.dataComplete);

    if (score.computedAt.isValid()) {
        obj.insert(QStringLiteral("computed_at_ms"),
                   static_cast<qint64>(score.computedAt.toMSecsSinceEpoch()));
    }

    QJsonArray components;
    for (const auto &c : score.components) {
        components.push_back(componentToJson(c));
    }
    obj.insert(QStringLiteral("components"), components);

    return obj;
}

std::optional<CompositeScore> scoreFromJson(const QJsonObject &obj)
{
    const auto kind = scoreKindFromString(obj.value(QStringLiteral("kind")).toString());
    const QDate day = dayFromString(obj.value(QStringLiteral("day")).toString());
    if (!kind || !day.isValid()) {
        return std::nullopt;
    }

    CompositeScore score;
    score.kind         = *kind;
    score.day          = day;
    score.overall      = obj.value(QStringLiteral("overall")).toInt();
    score.dataComplete = obj.value(QStringLiteral("data_complete")).toBool();

    if (obj.contains(QStringLiteral("computed_at_ms"))) {
        score.computedAt = QDateTime::fromMSecsSinceEpoch(
            obj.value(QStringLiteral("computed_at_ms")).toInteger(),
            QTimeZone::utc()
        );
    }

    const QJsonArray components = obj.value(QStringLiteral("components")).toArray();
    score.components.reserve(components.size());
    for (const QJsonValue &v : components) {
        if (v.isObject()) {
            score.components.push_back(componentFromJson(v.toObject()));
        }
    }

    return score;
}

QString scoreToJsonString(const CompositeScore &score)
{
    return QString::fromUtf8(
        QJsonDocument(scoreToJson(score)).toJson(QJsonDocument::Compact)
    );
}

std::optional<CompositeScore> scoreFromJsonString(const QString &json)
{
    const QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8());
    if (!doc.isObject()) {
        return std::nullopt;
    }
    return scoreFromJson(doc.object());
}

} // namespace kvital
