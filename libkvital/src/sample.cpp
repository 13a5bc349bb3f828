#include "kvital/sample.hpp"

#include "kvital/common.hpp"

#include <QDebug>
#include <QJsonDocument>
#include <QJsonValue>
#include <QTimeZone>

#include <cmath>

namespace kvital {

const std::vector<MetricKind> &allMetricKinds()
{
    static const std::vector<MetricKind> kinds = {
        MetricKind::HeartRateVariability,
        MetricKind::RestingHeartRate,
        MetricKind::WalkingHeartRate,
        MetricKind::RespiratoryRate,
        MetricKind::OxygenSaturation,
        MetricKind::SleepingHeartRate,
        MetricKind::TimeInBed,
        MetricKind::TimeAsleep,
        MetricKind::DeepSleep,
        MetricKind::RemSleep,
        MetricKind::Bedtime,
        MetricKind::WakeTime,
    };
    return kinds;
}

bool isSleepMetric(MetricKind kind)
{
    switch (kind) {
    case MetricKind::SleepingHeartRate:
    case MetricKind::TimeInBed:
    case MetricKind::TimeAsleep:
    case MetricKind::DeepSleep:
    case MetricKind::RemSleep:
    case MetricKind::Bedtime:
    case MetricKind::WakeTime:
        return true;
    case MetricKind::HeartRateVariability:
    case MetricKind::RestingHeartRate:
    case MetricKind::WalkingHeartRate:
    case MetricKind::RespiratoryRate:
    case MetricKind::OxygenSaturation:
        return false;
    }

    return false;
}

QDate sampleDay(const BiometricSample &sample)
{
    const QDateTime local = sample.timestamp.toLocalTime();
    if (!isSleepMetric(sample.kind)) {
        return local.date();
    }

    // Night window [D-1 12:00, D 12:00) belongs to wake day D.
    return local.addSecs(static_cast<qint64>(24 - NightBoundaryHour) * 3600).date();
}

QString metricKindToString(MetricKind kind)
{
    switch (kind) {
    case MetricKind::HeartRateVariability:
        return QStringLiteral("hrv");
    case MetricKind::RestingHeartRate:
        return QStringLiteral("resting_hr");
    case MetricKind::WalkingHeartRate:
        return QStringLiteral("walking_hr");
    case MetricKind::RespiratoryRate:
        return QStringLiteral("respiratory_rate");
    case MetricKind::OxygenSaturation:
        return QStringLiteral("oxygen_saturation");
    case MetricKind::SleepingHeartRate:
        return QStringLiteral("sleeping_hr");
    case MetricKind::TimeInBed:
        return QStringLiteral("time_in_bed");
    case MetricKind::TimeAsleep:
        return QStringLiteral("time_asleep");
    case MetricKind::DeepSleep:
        return QStringLiteral("deep_sleep");
    case MetricKind::RemSleep:
        return QStringLiteral("rem_sleep");
    case MetricKind::Bedtime:
        return QStringLiteral("bedtime");
    case MetricKind::WakeTime:
        return QStringLiteral("wake_time");
    }

    return QStringLiteral("hrv");
}

std::optional<MetricKind> metricKindFromString(const QString &s)
{
    const QString lower = s.trimmed().toLower();

    for (MetricKind kind : allMetricKinds()) {
        if (lower == metricKindToString(kind)) {
            return kind;
        }
    }

    return std::nullopt;
}

QJsonObject sampleToJson(const BiometricSample &sample)
{
    QJsonObject obj;

    obj.insert(QStringLiteral("metric"), metricKindToString(sample.kind));
    if (sample.timestamp.isValid()) {
        obj.insert(QStringLiteral("timestamp"),
                   sample.timestamp.toUTC().toString(Qt::ISODateWithMs));
        obj.insert(QStringLiteral("timestamp_ms"),
                   static_cast<qint64>(sample.timestamp.toMSecsSinceEpoch()));
    }
    obj.insert(QStringLiteral("value"), sample.value);

    return obj;
}

std::optional<BiometricSample> sampleFromJson(const QJsonObject &obj)
{
    const auto kind = metricKindFromString(obj.value(QStringLiteral("metric")).toString());
    if (!kind) {
        return std::nullopt;
    }

    BiometricSample sample;
    sample.kind = *kind;

    // Timestamp: prefer timestamp_ms, fall back to ISO string
    if (obj.contains(QStringLiteral("timestamp_ms"))) {
        sample.timestamp = QDateTime::fromMSecsSinceEpoch(
            obj.value(QStringLiteral("timestamp_ms")).toInteger(),
            QTimeZone::utc()
        );
    } else if (obj.contains(QStringLiteral("timestamp"))) {
        const QString tsStr = obj.value(QStringLiteral("timestamp")).toString();
        QDateTime dt = QDateTime::fromString(tsStr, Qt::ISODateWithMs);
        if (!dt.isValid()) {
            dt = QDateTime::fromString(tsStr, Qt::ISODate);
        }
        sample.timestamp = dt;
    }

    if (!sample.timestamp.isValid()) {
        return std::nullopt;
    }

    const QJsonValue value = obj.value(QStringLiteral("value"));
    if (!value.isDouble() || !std::isfinite(value.toDouble())) {
        return std::nullopt;
    }
    sample.value = value.toDouble();

    return sample;
}

std::vector<BiometricSample> samplesFromJsonString(const QString &json)
{
    std::vector<BiometricSample> samples;

    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError) {
        qWarning() << "samplesFromJsonString: parse error:" << err.errorString();
        return samples;
    }

    auto take = [&samples](const QJsonValue &v) {
        if (!v.isObject()) {
            return;
        }
        auto sample = sampleFromJson(v.toObject());
        if (!sample) {
            qWarning() << "samplesFromJsonString: dropping malformed sample"
                       << QJsonDocument(v.toObject()).toJson(QJsonDocument::Compact);
            return;
        }
        samples.push_back(*sample);
    };

    if (doc.isArray()) {
        const QJsonArray arr = doc.array();
        samples.reserve(arr.size());
        for (const QJsonValue &v : arr) {
            take(v);
        }
    } else if (doc.isObject()) {
        take(doc.object());
    }

    return samples;
}

QString samplesToJsonString(const std::vector<BiometricSample> &samples)
{
    QJsonArray arr;
    for (const auto &sample : samples) {
        arr.push_back(sampleToJson(sample));
    }
    return QString::fromUtf8(QJsonDocument(arr).toJson(QJsonDocument::Compact));
}

} // namespace kvital
