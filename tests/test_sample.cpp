#include <QtTest>
#include <QTimeZone>

#include "kvital/sample.hpp"
#include "kvital/score.hpp"

#include "fakes.hpp"

using namespace kvital;
using kvital::testing::localTime;
using kvital::testing::makeSample;

class TestSample : public QObject
{
    Q_OBJECT

private slots:
    void metricNamesRoundTrip()
    {
        for (MetricKind kind : allMetricKinds()) {
            const auto parsed = metricKindFromString(metricKindToString(kind));
            QVERIFY(parsed.has_value());
            QCOMPARE(*parsed, kind);
        }
        QCOMPARE(metricKindFromString(QStringLiteral(" HRV ")), std::optional<MetricKind>(MetricKind::HeartRateVariability));
        QVERIFY(!metricKindFromString(QStringLiteral("steps")).has_value());
    }

    void daytimeSamplesUseCalendarDay()
    {
        const QDate day(2024, 3, 10);
        QCOMPARE(sampleDay(makeSample(MetricKind::HeartRateVariability, localTime(day, 0, 5), 40)), day);
        QCOMPARE(sampleDay(makeSample(MetricKind::RestingHeartRate, localTime(day, 23, 55), 55)), day);
    }

    void sleepSamplesBelongToWakeDay()
    {
        const QDate day(2024, 3, 10);
        // Evening before
        QCOMPARE(sampleDay(makeSample(MetricKind::DeepSleep, localTime(day.addDays(-1), 23, 30), 20)), day);
        QCOMPARE(sampleDay(makeSample(MetricKind::Bedtime, localTime(day.addDays(-1), 12, 0), -60)), day);
        // Early morning
        QCOMPARE(sampleDay(makeSample(MetricKind::WakeTime, localTime(day, 6, 45), 405)), day);
        QCOMPARE(sampleDay(makeSample(MetricKind::RemSleep, localTime(day, 11, 59), 10)), day);
        // Noon starts the next night
        QCOMPARE(sampleDay(makeSample(MetricKind::TimeInBed, localTime(day, 12, 0), 30)), day.addDays(1));
    }

    void parsesSingleObjectAndArray()
    {
        const auto one = samplesFromJsonString(QStringLiteral(
            R"({"metric":"hrv","timestamp_ms":1710000000000,"value":42.5})"));
        QCOMPARE(one.size(), std::size_t(1));
        QCOMPARE(one[0].kind, MetricKind::HeartRateVariability);
        QCOMPARE(one[0].timestamp.toMSecsSinceEpoch(), qint64(1710000000000));
        QCOMPARE(one[0].value, 42.5);

        const auto many = samplesFromJsonString(QStringLiteral(
            R"([{"metric":"resting_hr","timestamp":"2024-03-10T07:00:00Z","value":52},)"
            R"({"metric":"bedtime","timestamp":"2024-03-09T23:15:00Z","value":-45}])"));
        QCOMPARE(many.size(), std::size_t(2));
        QCOMPARE(many[0].kind, MetricKind::RestingHeartRate);
        QCOMPARE(many[1].value, -45.0);
    }

    void dropsMalformedSamples()
    {
        const auto samples = samplesFromJsonString(QStringLiteral(
            R"([{"metric":"steps","timestamp_ms":1,"value":1},)"
            R"({"metric":"hrv","value":40},)"
            R"({"metric":"hrv","timestamp_ms":1710000000000,"value":"high"},)"
            R"({"metric":"hrv","timestamp_ms":1710000000000,"value":41}])"));
        QCOMPARE(samples.size(), std::size_t(1));
        QCOMPARE(samples[0].value, 41.0);

        QVERIFY(samplesFromJsonString(QStringLiteral("not json")).empty());
    }

    void serializedSamplesParseBack()
    {
        const std::vector<BiometricSample> in = {
            makeSample(MetricKind::OxygenSaturation, localTime(QDate(2024, 3, 10), 4, 0), 97.0),
            makeSample(MetricKind::WakeTime, localTime(QDate(2024, 3, 10), 6, 30), 390.0),
        };
        const auto out = samplesFromJsonString(samplesToJsonString(in));
        QCOMPARE(out.size(), in.size());
        for (std::size_t i = 0; i < in.size(); ++i) {
            QCOMPARE(out[i].kind, in[i].kind);
            QCOMPARE(out[i].timestamp, in[i].timestamp);
            QCOMPARE(out[i].value, in[i].value);
        }
    }

    void scoreJsonKeepsComponents()
    {
        CompositeScore score;
        score.kind = ScoreKind::Sleep;
        score.day = QDate(2024, 3, 10);
        score.overall = 3;
        score.computedAt = QDateTime::fromMSecsSinceEpoch(1710050000123, QTimeZone::utc());

        ScoreComponent rem;
        rem.name = QStringLiteral("rem_sleep");
        rem.weight = 0.2;
        rem.normalizedValue = 15.0;
        rem.contribution = 3.0;
        rem.complete = true;
        rem.rawInputs.insert(QStringLiteral("minutes"), 36);
        score.components.push_back(rem);

        ScoreComponent duration;
        duration.name = QStringLiteral("duration");
        duration.weight = 0.3;
        duration.degradation = ScoreError::MissingSample;
        duration.description = QStringLiteral("No sleep duration recorded");
        score.components.push_back(duration);

        const auto parsed = scoreFromJsonString(scoreToJsonString(score));
        QVERIFY(parsed.has_value());
        QCOMPARE(*parsed, score);
        QCOMPARE(parsed->components[1].degradation, ScoreError::MissingSample);
    }

    void scoreKeyFormatting()
    {
        QCOMPARE(scoreKeyToString(ScoreKey{QDate(2024, 3, 10), ScoreKind::Recovery}),
                 QStringLiteral("2024-03-10/recovery"));
        QVERIFY(!scoreKindFromString(QStringLiteral("strain")).has_value());
    }
};

QTEST_GUILESS_MAIN(TestSample)
#include "test_sample.moc"
