#pragma once

#include <QDate>
#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <optional>
#include <vector>

namespace kvital {

enum class MetricKind {
    HeartRateVariability,
    RestingHeartRate,
    WalkingHeartRate,
    RespiratoryRate,
    OxygenSaturation,
    SleepingHeartRate,
    TimeInBed,
    TimeAsleep,
    DeepSleep,
    RemSleep,
    Bedtime,
    WakeTime
};

// Every MetricKind, in declaration order.
const std::vector<MetricKind> &allMetricKinds();

// True for kinds that describe a night's sleep and are attributed to the
// wake day rather than the calendar day of their timestamp.
bool isSleepMetric(MetricKind kind);

struct BiometricSample
{
    MetricKind kind = MetricKind::HeartRateVariability;
    QDateTime  timestamp;
    double     value = 0.0;
};

// Calendar day (user-local) a sample belongs to.
QDate sampleDay(const BiometricSample &sample);

// String conversions
QString metricKindToString(MetricKind kind);
std::optional<MetricKind> metricKindFromString(const QString &s);

// JSON helpers. Parsing returns nullopt for malformed objects or unknown
// metric names.
QJsonObject sampleToJson(const BiometricSample &sample);
std::optional<BiometricSample> sampleFromJson(const QJsonObject &obj);

// Accepts either a single sample object or an array of them.
std::vector<BiometricSample> samplesFromJsonString(const QString &json);
QString samplesToJsonString(const std::vector<BiometricSample> &samples);

} // namespace kvital
