#include "kvital/scoring_engine.hpp"

#include "kvital/common.hpp"
#include "kvital/interpretation.hpp"

#include <QDebug>
#include <QJsonObject>

#include <algorithm>
#include <cmath>

namespace kvital {

namespace {

// Recovery sleep-quality sub-weights.
constexpr double kSubEfficiency = 0.30;
constexpr double kSubDeepRem = 0.30;
constexpr double kSubHeartRateDip = 0.25;
constexpr double kSubConsistency = 0.15;

// Sleeping heart rate above this multiple of RHR is treated as a reading
// artefact and capped.
constexpr double kSleepingHeartRateCap = 1.1;

bool isSummed(MetricKind kind)
{
    switch (kind) {
    case MetricKind::TimeInBed:
    case MetricKind::TimeAsleep:
    case MetricKind::DeepSleep:
    case MetricKind::RemSleep:
        return true;
    default:
        return false;
    }
}

std::optional<double> baselineValue(const BaselineSet &baselines, MetricKind kind)
{
    auto it = baselines.find(kind);
    if (it == baselines.end() || !it->second.available() || !it->second.aggregate) {
        return std::nullopt;
    }
    return *it->second.aggregate;
}

ScoreComponent degraded(const char *name, ScoreError reason, const QString &description)
{
    ScoreComponent c;
    c.name = QString::fromLatin1(name);
    c.normalizedValue = 0.0;
    c.complete = false;
    c.degradation = reason;
    c.description = description;
    return c;
}

ScoreComponent pointsComponent(const char *name, double points, int maxPoints,
                               QJsonObject inputs, const QString &description)
{
    ScoreComponent c;
    c.name = QString::fromLatin1(name);
    c.normalizedValue = clampScore(points * 100.0 / maxPoints);
    inputs.insert(QStringLiteral("points"), points);
    inputs.insert(QStringLiteral("max_points"), maxPoints);
    c.rawInputs = inputs;
    c.complete = true;
    c.description = description;
    return c;
}

QString signedPercent(double ratio)
{
    const double pct = (ratio - 1.0) * 100.0;
    return QStringLiteral("%1%2%")
        .arg(pct >= 0 ? QStringLiteral("+") : QString())
        .arg(pct, 0, 'f', 1);
}

} // namespace

// ---------------------------------------------------------------------------
// DayMetrics

DayMetrics DayMetrics::fromSamples(const std::vector<BiometricSample> &samples)
{
    DayMetrics metrics;
    for (const auto &sample : samples) {
        metrics.add(sample);
    }
    return metrics;
}

void DayMetrics::add(const BiometricSample &sample)
{
    if (!std::isfinite(sample.value)) {
        return;
    }

    Accumulator &acc = accumulators_[sample.kind];
    if (acc.count == 0) {
        acc.min = sample.value;
        acc.max = sample.value;
    } else {
        acc.min = std::min(acc.min, sample.value);
        acc.max = std::max(acc.max, sample.value);
    }
    acc.sum += sample.value;
    acc.count++;
}

std::optional<double> DayMetrics::value(MetricKind kind) const
{
    auto it = accumulators_.find(kind);
    if (it == accumulators_.end() || it->second.count == 0) {
        return std::nullopt;
    }

    const Accumulator &acc = it->second;
    if (isSummed(kind)) {
        return acc.sum;
    }
    if (kind == MetricKind::Bedtime) {
        return acc.min;
    }
    if (kind == MetricKind::WakeTime) {
        return acc.max;
    }
    return acc.sum / acc.count;
}

int DayMetrics::sampleCount(MetricKind kind) const
{
    auto it = accumulators_.find(kind);
    return it == accumulators_.end() ? 0 : it->second.count;
}

// ---------------------------------------------------------------------------
// Point tables

int durationPoints(double minutesAsleep)
{
    static const std::pair<double, int> table[] = {
        {470, 29}, {460, 28}, {450, 27}, {440, 26}, {420, 25}, {410, 24},
        {400, 22}, {390, 20}, {380, 18}, {370, 16}, {360, 15}, {330, 10},
        {300, 5},
    };

    if (minutesAsleep > 480) {
        return 30;
    }
    for (const auto &[threshold, points] : table) {
        if (minutesAsleep >= threshold) {
            return points;
        }
    }
    return 0;
}

int deepSleepPoints(double minutes)
{
    if (minutes >= 105) return 25;
    if (minutes >= 90) return 22;
    if (minutes >= 75) return 18;
    if (minutes >= 60) return 14;
    if (minutes >= 45) return 8;
    return 0;
}

int remSleepPoints(double minutes)
{
    if (minutes >= 120) return 20;
    if (minutes >= 105) return 18;
    if (minutes >= 90) return 16;
    if (minutes >= 75) return 13;
    if (minutes >= 60) return 10;
    if (minutes <= 0) return 0;
    // Proportional below an hour, up to 5 points.
    return static_cast<int>(std::floor(minutes / 60.0 * 5.0));
}

int efficiencyPoints(double efficiencyPct)
{
    if (efficiencyPct >= 95) return 15;
    if (efficiencyPct >= 92.5) return 12;
    if (efficiencyPct >= 90) return 10;
    if (efficiencyPct >= 85) return 5;
    return 0;
}

double bedtimeConsistencyPoints(double bedtimeOffset, double targetOffset)
{
    // Going to bed early is never penalised; each 10 minutes late costs a point.
    const double lateMinutes = bedtimeOffset - targetOffset;
    if (lateMinutes <= 0) {
        return MaxConsistencyPoints;
    }
    return std::max(0.0, MaxConsistencyPoints - lateMinutes / 10.0);
}

double wakeConsistencyPoints(double wakeOffset, double targetOffset)
{
    const double deviation = std::abs(wakeOffset - targetOffset);
    return std::max(0.0, MaxConsistencyPoints - deviation / 10.0);
}

// ---------------------------------------------------------------------------
// ScoringEngine

ScoringEngine::ScoringEngine(ScoringConfig config)
    : config_(config)
{
}

const std::vector<MetricKind> &ScoringEngine::inputMetrics(ScoreKind kind)
{
    static const std::vector<MetricKind> recovery = {
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
    static const std::vector<MetricKind> sleep = {
        MetricKind::TimeInBed,
        MetricKind::TimeAsleep,
        MetricKind::DeepSleep,
        MetricKind::RemSleep,
        MetricKind::Bedtime,
    };

    switch (kind) {
    case ScoreKind::Recovery:
        return recovery;
    case ScoreKind::Sleep:
        return sleep;
    }
    return recovery;
}

const std::vector<MetricKind> &ScoringEngine::baselineMetrics(ScoreKind kind)
{
    static const std::vector<MetricKind> recovery = {
        MetricKind::HeartRateVariability,
        MetricKind::RestingHeartRate,
        MetricKind::WalkingHeartRate,
        MetricKind::RespiratoryRate,
        MetricKind::OxygenSaturation,
        MetricKind::Bedtime,
        MetricKind::WakeTime,
    };
    static const std::vector<MetricKind> sleep = {
        MetricKind::Bedtime,
    };

    switch (kind) {
    case ScoreKind::Recovery:
        return recovery;
    case ScoreKind::Sleep:
        return sleep;
    }
    return recovery;
}

const std::vector<std::pair<const char *, double>> &ScoringEngine::profileWeights(ScoreKind kind)
{
    static const std::vector<std::pair<const char *, double>> recovery = {
        {component::Hrv, 0.50},
        {component::RestingHeartRate, 0.25},
        {component::SleepQuality, 0.15},
        {component::Stress, 0.10},
    };
    static const std::vector<std::pair<const char *, double>> sleep = {
        {component::Duration, 0.30},
        {component::DeepSleep, 0.25},
        {component::RemSleep, 0.20},
        {component::Efficiency, 0.15},
        {component::Consistency, 0.10},
    };

    switch (kind) {
    case ScoreKind::Recovery:
        return recovery;
    case ScoreKind::Sleep:
        return sleep;
    }
    return recovery;
}

bool ScoringEngine::metricAffects(MetricKind metric, ScoreKind kind)
{
    const auto &inputs = inputMetrics(kind);
    const auto &baselines = baselineMetrics(kind);
    return std::find(inputs.begin(), inputs.end(), metric) != inputs.end()
        || std::find(baselines.begin(), baselines.end(), metric) != baselines.end();
}

CompositeScore ScoringEngine::computeScore(ScoreKind kind,
                                           const QDate &day,
                                           const DayMetrics &metrics,
                                           const BaselineSet &baselines,
                                           const QDateTime &computedAt) const
{
    CompositeScore score;
    score.kind = kind;
    score.day = day;
    score.computedAt = computedAt;

    switch (kind) {
    case ScoreKind::Recovery:
        score.components = recoveryComponents(metrics, baselines);
        break;
    case ScoreKind::Sleep:
        score.components = sleepComponents(metrics, baselines);
        break;
    }

    const auto &weights = profileWeights(kind);
    Q_ASSERT(weights.size() == score.components.size());

    double total = 0.0;
    bool complete = true;
    for (std::size_t i = 0; i < score.components.size(); ++i) {
        ScoreComponent &c = score.components[i];
        c.weight = weights[i].second;
        c.normalizedValue = clampScore(c.normalizedValue);
        if (!c.complete && c.normalizedValue > 0.0) {
            // Incomplete components contribute nothing; keep what the
            // available inputs gave for diagnostics.
            c.rawInputs.insert(QStringLiteral("partial_value"), c.normalizedValue);
            c.normalizedValue = 0.0;
        }
        c.contribution = c.weight * c.normalizedValue;
        total += c.contribution;
        complete = complete && c.complete;

        if (!c.complete) {
            qDebug() << "ScoringEngine:" << scoreKeyToString(keyOf(score))
                     << c.name << "degraded:" << scoreErrorToString(c.degradation);
        }
    }

    score.overall = clampValue(static_cast<int>(std::lround(total)), 0, 100);
    score.dataComplete = complete;

    return score;
}

std::vector<ScoreComponent> ScoringEngine::recoveryComponents(const DayMetrics &metrics,
                                                              const BaselineSet &baselines) const
{
    return {
        ratioComponent(component::Hrv, MetricKind::HeartRateVariability, true,
                       metrics, baselines),
        ratioComponent(component::RestingHeartRate, MetricKind::RestingHeartRate, false,
                       metrics, baselines),
        sleepQualityComponent(metrics, baselines),
        stressComponent(metrics, baselines),
    };
}

ScoreComponent ScoringEngine::ratioComponent(const char *name,
                                             MetricKind metric,
                                             bool higherIsBetter,
                                             const DayMetrics &metrics,
                                             const BaselineSet &baselines) const
{
    const QString label = metricKindToString(metric);
    const auto current = metrics.value(metric);
    if (!current || *current <= 0.0) {
        return degraded(name, ScoreError::MissingSample,
                        QStringLiteral("No %1 sample for this day").arg(label));
    }

    const auto baseline = baselineValue(baselines, metric);
    if (!baseline || *baseline <= 0.0) {
        ScoreComponent c = degraded(name, ScoreError::InsufficientBaseline,
                                    QStringLiteral("Not enough history for a %1 baseline").arg(label));
        c.rawInputs.insert(QStringLiteral("current"), *current);
        return c;
    }

    // Inverted for lower-is-better metrics so that ratio > 1 is always good.
    const double ratio = higherIsBetter ? *current / *baseline : *baseline / *current;

    ScoreComponent c;
    c.name = QString::fromLatin1(name);
    c.normalizedValue = growthCurveScore(ratio, config_.curve);
    c.rawInputs.insert(QStringLiteral("current"), *current);
    c.rawInputs.insert(QStringLiteral("baseline"), *baseline);
    c.rawInputs.insert(QStringLiteral("ratio"), ratio);
    c.complete = true;
    c.description = QStringLiteral("%1 %2 vs baseline %3 (%4)")
        .arg(label)
        .arg(*current, 0, 'f', 1)
        .arg(*baseline, 0, 'f', 1)
        .arg(signedPercent(*current / *baseline));
    return c;
}

ScoreComponent ScoringEngine::sleepQualityComponent(const DayMetrics &metrics,
                                                    const BaselineSet &baselines) const
{
    ScoreComponent c;
    c.name = QString::fromLatin1(component::SleepQuality);

    bool missingSample = false;
    bool missingBaseline = false;
    double value = 0.0;

    // Efficiency
    const auto asleep = metrics.value(MetricKind::TimeAsleep);
    const auto inBed = metrics.value(MetricKind::TimeInBed);
    if (asleep && inBed && *inBed > 0.0) {
        const double pct = *asleep / *inBed * 100.0;
        const double sub = efficiencyPoints(pct) * 100.0 / MaxEfficiencyPoints;
        c.rawInputs.insert(QStringLiteral("efficiency_pct"), pct);
        c.rawInputs.insert(QStringLiteral("efficiency_score"), sub);
        value += kSubEfficiency * sub;
    } else {
        missingSample = true;
    }

    // Deep + REM
    const auto deep = metrics.value(MetricKind::DeepSleep);
    const auto rem = metrics.value(MetricKind::RemSleep);
    if (deep && rem) {
        const double sub = (deepSleepPoints(*deep) + remSleepPoints(*rem)) * 100.0
            / (MaxDeepSleepPoints + MaxRemSleepPoints);
        c.rawInputs.insert(QStringLiteral("deep_minutes"), *deep);
        c.rawInputs.insert(QStringLiteral("rem_minutes"), *rem);
        c.rawInputs.insert(QStringLiteral("deep_rem_score"), sub);
        value += kSubDeepRem * sub;
    } else {
        missingSample = true;
    }

    // Heart-rate dip while asleep, relative to today's RHR.
    const auto sleepingHr = metrics.value(MetricKind::SleepingHeartRate);
    const auto rhr = metrics.value(MetricKind::RestingHeartRate);
    if (sleepingHr && rhr && *rhr > 0.0) {
        const double hr = std::min(*sleepingHr, *rhr * kSleepingHeartRateCap);
        const double dipPct = (1.0 - hr / *rhr) * 100.0;
        const double sub = clampScore(dipPct / config_.heartRateDipTargetPct * 100.0);
        c.rawInputs.insert(QStringLiteral("heart_rate_dip_pct"), dipPct);
        c.rawInputs.insert(QStringLiteral("heart_rate_dip_score"), sub);
        value += kSubHeartRateDip * sub;
    } else {
        missingSample = true;
    }

    // Bedtime / wake consistency against the trailing baselines.
    double consistencyPoints = 0.0;
    int consistencyParts = 0;
    const auto bedtime = metrics.value(MetricKind::Bedtime);
    const auto bedtimeTarget = baselineValue(baselines, MetricKind::Bedtime);
    if (!bedtime) {
        missingSample = true;
    } else if (!bedtimeTarget) {
        missingBaseline = true;
    } else {
        consistencyPoints += bedtimeConsistencyPoints(*bedtime, *bedtimeTarget);
        consistencyParts++;
    }
    const auto wake = metrics.value(MetricKind::WakeTime);
    const auto wakeTarget = baselineValue(baselines, MetricKind::WakeTime);
    if (!wake) {
        missingSample = true;
    } else if (!wakeTarget) {
        missingBaseline = true;
    } else {
        consistencyPoints += wakeConsistencyPoints(*wake, *wakeTarget);
        consistencyParts++;
    }
    if (consistencyParts > 0) {
        const double sub = consistencyPoints / consistencyParts * 100.0 / MaxConsistencyPoints;
        c.rawInputs.insert(QStringLiteral("consistency_score"), sub);
        value += kSubConsistency * sub;
    }

    c.normalizedValue = clampScore(value);
    c.complete = !missingSample && !missingBaseline;
    if (missingSample) {
        c.degradation = ScoreError::MissingSample;
    } else if (missingBaseline) {
        c.degradation = ScoreError::InsufficientBaseline;
    }
    c.description = c.complete
        ? sleepSummary(static_cast<int>(std::lround(c.normalizedValue)))
        : QStringLiteral("Sleep quality from partial data");
    return c;
}

ScoreComponent ScoringEngine::stressComponent(const DayMetrics &metrics,
                                              const BaselineSet &baselines) const
{
    struct Input {
        MetricKind kind;
        double sensitivity;
    };
    const Input inputs[] = {
        {MetricKind::WalkingHeartRate, config_.stress.walkingHeartRate},
        {MetricKind::RespiratoryRate, config_.stress.respiratoryRate},
        {MetricKind::OxygenSaturation, config_.stress.oxygenSaturation},
    };

    ScoreComponent c;
    c.name = QString::fromLatin1(component::Stress);

    double total = 0.0;
    int used = 0;
    bool missingSample = false;
    bool missingBaseline = false;

    for (const Input &input : inputs) {
        const auto current = metrics.value(input.kind);
        const auto baseline = baselineValue(baselines, input.kind);
        if (!current) {
            missingSample = true;
            continue;
        }
        if (!baseline || *baseline <= 0.0) {
            missingBaseline = true;
            continue;
        }

        const double deviationPct = std::abs(*current - *baseline) / *baseline * 100.0;
        const double weighted = deviationPct * input.sensitivity;
        c.rawInputs.insert(metricKindToString(input.kind) + QStringLiteral("_deviation_pct"),
                           deviationPct);
        total += weighted;
        used++;
    }

    if (used == 0) {
        c.degradation = missingSample ? ScoreError::MissingSample
                                      : ScoreError::InsufficientBaseline;
        c.description = QStringLiteral("Stress metrics unavailable");
        return c;
    }

    const double average = total / used;
    c.normalizedValue = clampScore(100.0 - average);
    c.rawInputs.insert(QStringLiteral("avg_weighted_deviation"), average);
    c.complete = !missingSample && !missingBaseline;
    if (missingSample) {
        c.degradation = ScoreError::MissingSample;
    } else if (missingBaseline) {
        c.degradation = ScoreError::InsufficientBaseline;
    }
    c.description = QStringLiteral("%1 stress (%2% weighted deviation from baseline)")
        .arg(stressBandToString(stressBand(average)))
        .arg(average, 0, 'f', 1);
    return c;
}

std::vector<ScoreComponent> ScoringEngine::sleepComponents(const DayMetrics &metrics,
                                                           const BaselineSet &baselines) const
{
    std::vector<ScoreComponent> components;
    components.reserve(5);

    const auto asleep = metrics.value(MetricKind::TimeAsleep);
    if (asleep) {
        QJsonObject in;
        in.insert(QStringLiteral("minutes_asleep"), *asleep);
        components.push_back(pointsComponent(
            component::Duration, durationPoints(*asleep), MaxDurationPoints, in,
            QStringLiteral("Slept %1h %2m")
                .arg(static_cast<int>(*asleep) / 60)
                .arg(static_cast<int>(*asleep) % 60)));
    } else {
        components.push_back(degraded(component::Duration, ScoreError::MissingSample,
                                      QStringLiteral("No sleep duration recorded")));
    }

    const auto deep = metrics.value(MetricKind::DeepSleep);
    if (deep) {
        QJsonObject in;
        in.insert(QStringLiteral("minutes"), *deep);
        components.push_back(pointsComponent(
            component::DeepSleep, deepSleepPoints(*deep), MaxDeepSleepPoints, in,
            QStringLiteral("%1 min deep sleep").arg(*deep, 0, 'f', 0)));
    } else {
        components.push_back(degraded(component::DeepSleep, ScoreError::MissingSample,
                                      QStringLiteral("No deep sleep recorded")));
    }

    const auto rem = metrics.value(MetricKind::RemSleep);
    if (rem) {
        QJsonObject in;
        in.insert(QStringLiteral("minutes"), *rem);
        components.push_back(pointsComponent(
            component::RemSleep, remSleepPoints(*rem), MaxRemSleepPoints, in,
            QStringLiteral("%1 min REM sleep").arg(*rem, 0, 'f', 0)));
    } else {
        components.push_back(degraded(component::RemSleep, ScoreError::MissingSample,
                                      QStringLiteral("No REM sleep recorded")));
    }

    const auto inBed = metrics.value(MetricKind::TimeInBed);
    if (asleep && inBed && *inBed > 0.0) {
        const double pct = *asleep / *inBed * 100.0;
        QJsonObject in;
        in.insert(QStringLiteral("efficiency_pct"), pct);
        components.push_back(pointsComponent(
            component::Efficiency, efficiencyPoints(pct), MaxEfficiencyPoints, in,
            QStringLiteral("%1% of time in bed asleep").arg(pct, 0, 'f', 1)));
    } else {
        components.push_back(degraded(component::Efficiency, ScoreError::MissingSample,
                                      QStringLiteral("Time in bed unavailable")));
    }

    const auto bedtime = metrics.value(MetricKind::Bedtime);
    const auto target = baselineValue(baselines, MetricKind::Bedtime);
    if (!bedtime) {
        components.push_back(degraded(component::Consistency, ScoreError::MissingSample,
                                      QStringLiteral("Bedtime unavailable")));
    } else if (!target) {
        ScoreComponent c = degraded(component::Consistency, ScoreError::InsufficientBaseline,
                                    QStringLiteral("Not enough history for a bedtime baseline"));
        c.rawInputs.insert(QStringLiteral("bedtime_offset"), *bedtime);
        components.push_back(c);
    } else {
        QJsonObject in;
        in.insert(QStringLiteral("bedtime_offset"), *bedtime);
        in.insert(QStringLiteral("target_offset"), *target);
        const double late = *bedtime - *target;
        components.push_back(pointsComponent(
            component::Consistency, bedtimeConsistencyPoints(*bedtime, *target),
            MaxConsistencyPoints, in,
            late > 0 ? QStringLiteral("Bedtime %1 min after your usual time").arg(late, 0, 'f', 0)
                     : QStringLiteral("Bedtime at or before your usual time")));
    }

    return components;
}

} // namespace kvital
