#pragma once

#include <QDate>
#include <QDateTime>
#include <QJsonObject>
#include <QMutex>
#include <atomic>
#include <future>
#include <map>
#include <optional>
#include <utility>

#include "kvital/sample.hpp"
#include "kvital/sample_source.hpp"

namespace kvital {

struct BaselineConfig
{
    int windowDays = 14;
    int minCoverage = 7;   // samples required before a baseline is usable
};

enum class BaselineStatus {
    Available,
    Insufficient
};

struct Baseline
{
    MetricKind kind = MetricKind::HeartRateVariability;
    QDate      asOf;
    int        windowDays = 0;
    BaselineStatus status = BaselineStatus::Insufficient;
    std::optional<double> aggregate;   // set only when Available
    int        sampleCount = 0;
    int        coveredDays = 0;
    QDateTime  computedAt;

    bool available() const { return status == BaselineStatus::Available; }
};

QString baselineStatusToString(BaselineStatus status);
QJsonObject baselineToJson(const Baseline &baseline);

// Rolling trailing-window mean per metric. The window for `asOf` is
// [asOf - windowDays, asOf - 1]; the day being scored never feeds its own
// reference. Results are cached per (kind, asOf) until a sample lands
// inside the window. Safe for concurrent use; concurrent requests for the
// same entry share a single computation.
class BaselineTracker
{
public:
    explicit BaselineTracker(SampleSource &source, BaselineConfig config = {});

    Baseline refreshBaseline(MetricKind kind, const QDate &asOf);

    // Cached value only; never touches the sample source.
    std::optional<Baseline> cachedBaseline(MetricKind kind, const QDate &asOf) const;

    // Drop every cached baseline of `kind` whose window contains `sampleDay`.
    void invalidate(MetricKind kind, const QDate &sampleDay);
    void clear();

    const BaselineConfig &config() const { return config_; }

    // Number of baselines actually computed from samples (diagnostics).
    int computeCount() const { return computeCount_.load(); }

private:
    using Key = std::pair<MetricKind, QDate>;

    Baseline compute(MetricKind kind, const QDate &asOf);

    SampleSource &source_;
    BaselineConfig config_;

    mutable QMutex mutex_;
    std::map<Key, std::shared_future<Baseline>> entries_;
    std::atomic<int> computeCount_{0};
};

} // namespace kvital
