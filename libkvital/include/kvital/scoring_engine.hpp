#pragma once

#include <QDate>
#include <QDateTime>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "kvital/baseline_tracker.hpp"
#include "kvital/growth_curve.hpp"
#include "kvital/sample.hpp"
#include "kvital/score.hpp"

namespace kvital {

// Component names, as they appear in CompositeScore::components.
namespace component {
constexpr const char *Hrv = "hrv";
constexpr const char *RestingHeartRate = "resting_hr";
constexpr const char *SleepQuality = "sleep_quality";
constexpr const char *Stress = "stress";
constexpr const char *Duration = "duration";
constexpr const char *DeepSleep = "deep_sleep";
constexpr const char *RemSleep = "rem_sleep";
constexpr const char *Efficiency = "efficiency";
constexpr const char *Consistency = "consistency";
} // namespace component

struct StressSensitivity
{
    double walkingHeartRate = 1.2;
    double respiratoryRate = 1.5;
    double oxygenSaturation = 2.0;
};

struct ScoringConfig
{
    GrowthCurveConfig curve;
    StressSensitivity stress;
    double heartRateDipTargetPct = 15.0;   // dip that earns a full sub-score
};

// One day's samples folded into a single value per metric. Sleep-stage
// durations are summed, bedtime keeps the earliest value, wake time the
// latest, everything else is averaged.
class DayMetrics
{
public:
    static DayMetrics fromSamples(const std::vector<BiometricSample> &samples);

    void add(const BiometricSample &sample);
    std::optional<double> value(MetricKind kind) const;
    int sampleCount(MetricKind kind) const;

private:
    struct Accumulator {
        double sum = 0.0;
        double min = 0.0;
        double max = 0.0;
        int count = 0;
    };

    std::map<MetricKind, Accumulator> accumulators_;
};

using BaselineSet = std::map<MetricKind, Baseline>;

// Sleep point tables. Inputs are minutes, or percent for efficiency.
int durationPoints(double minutesAsleep);
int deepSleepPoints(double minutes);
int remSleepPoints(double minutes);
int efficiencyPoints(double efficiencyPct);
// Offsets are minutes from local midnight (negative before midnight).
double bedtimeConsistencyPoints(double bedtimeOffset, double targetOffset);
double wakeConsistencyPoints(double wakeOffset, double targetOffset);

constexpr int MaxDurationPoints = 30;
constexpr int MaxDeepSleepPoints = 25;
constexpr int MaxRemSleepPoints = 20;
constexpr int MaxEfficiencyPoints = 15;
constexpr int MaxConsistencyPoints = 10;

// Pure scoring. Never throws for missing data: absent inputs produce a
// component with normalizedValue 0 and complete == false.
class ScoringEngine
{
public:
    explicit ScoringEngine(ScoringConfig config = {});

    CompositeScore computeScore(ScoreKind kind,
                                const QDate &day,
                                const DayMetrics &metrics,
                                const BaselineSet &baselines,
                                const QDateTime &computedAt) const;

    // Metrics read from the scored day itself.
    static const std::vector<MetricKind> &inputMetrics(ScoreKind kind);
    // Metrics whose trailing baseline the profile needs.
    static const std::vector<MetricKind> &baselineMetrics(ScoreKind kind);
    // Top-level component names and weights, in component order.
    static const std::vector<std::pair<const char *, double>> &profileWeights(ScoreKind kind);

    static bool metricAffects(MetricKind metric, ScoreKind kind);

    const ScoringConfig &config() const { return config_; }

private:
    std::vector<ScoreComponent> recoveryComponents(const DayMetrics &metrics,
                                                   const BaselineSet &baselines) const;
    std::vector<ScoreComponent> sleepComponents(const DayMetrics &metrics,
                                                const BaselineSet &baselines) const;

    ScoreComponent ratioComponent(const char *name,
                                  MetricKind metric,
                                  bool higherIsBetter,
                                  const DayMetrics &metrics,
                                  const BaselineSet &baselines) const;
    ScoreComponent sleepQualityComponent(const DayMetrics &metrics,
                                         const BaselineSet &baselines) const;
    ScoreComponent stressComponent(const DayMetrics &metrics,
                                   const BaselineSet &baselines) const;

    ScoringConfig config_;
};

} // namespace kvital
