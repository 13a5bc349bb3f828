#include "kvital/baseline_tracker.hpp"

#include "kvital/common.hpp"

#include <QDebug>
#include <QSet>

namespace kvital {

QString baselineStatusToString(BaselineStatus status)
{
    switch (status) {
    case BaselineStatus::Available:
        return QStringLiteral("available");
    case BaselineStatus::Insufficient:
        return QStringLiteral("insufficient");
    }

    return QStringLiteral("insufficient");
}

QJsonObject baselineToJson(const Baseline &baseline)
{
    QJsonObject obj;

    obj.insert(QStringLiteral("metric"), metricKindToString(baseline.kind));
    obj.insert(QStringLiteral("as_of"), dayToString(baseline.asOf));
    obj.insert(QStringLiteral("window_days"), baseline.windowDays);
    obj.insert(QStringLiteral("status"), baselineStatusToString(baseline.status));
    obj.insert(QStringLiteral("sample_count"), baseline.sampleCount);
    obj.insert(QStringLiteral("covered_days"), baseline.coveredDays);

    if (baseline.aggregate) {
        obj.insert(QStringLiteral("aggregate"), *baseline.aggregate);
    }
    if (baseline.computedAt.isValid()) {
        obj.insert(QStringLiteral("computed_at_ms"),
                   static_cast<qint64>(baseline.computedAt.toMSecsSinceEpoch()));
    }

    return obj;
}

BaselineTracker::BaselineTracker(SampleSource &source, BaselineConfig config)
    : source_(source)
    , config_(config)
{
}

Baseline BaselineTracker::refreshBaseline(MetricKind kind, const QDate &asOf)
{
    const Key key{kind, asOf};

    std::shared_ptr<std::promise<Baseline>> promise;
    std::shared_future<Baseline> result;
    {
        QMutexLocker lock(&mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            result = it->second;
        } else {
            promise = std::make_shared<std::promise<Baseline>>();
            result = promise->get_future().share();
            entries_.emplace(key, result);
        }
    }

    if (promise) {
        promise->set_value(compute(kind, asOf));
    }

    return result.get();
}

std::optional<Baseline> BaselineTracker::cachedBaseline(MetricKind kind, const QDate &asOf) const
{
    QMutexLocker lock(&mutex_);
    auto it = entries_.find(Key{kind, asOf});
    if (it == entries_.end()) {
        return std::nullopt;
    }

    // Still being computed by another caller.
    if (it->second.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return std::nullopt;
    }

    return it->second.get();
}

void BaselineTracker::invalidate(MetricKind kind, const QDate &sampleDay)
{
    QMutexLocker lock(&mutex_);

    for (auto it = entries_.begin(); it != entries_.end();) {
        const QDate &asOf = it->first.second;
        const bool inWindow = it->first.first == kind
            && sampleDay < asOf
            && sampleDay >= asOf.addDays(-config_.windowDays);
        if (inWindow) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

void BaselineTracker::clear()
{
    QMutexLocker lock(&mutex_);
    entries_.clear();
}

Baseline BaselineTracker::compute(MetricKind kind, const QDate &asOf)
{
    computeCount_.fetch_add(1);

    Baseline baseline;
    baseline.kind = kind;
    baseline.asOf = asOf;
    baseline.windowDays = config_.windowDays;
    baseline.computedAt = nowUtc();

    if (!asOf.isValid() || config_.windowDays <= 0) {
        return baseline;
    }

    const QDate first = asOf.addDays(-config_.windowDays);
    const QDate last = asOf.addDays(-1);
    const auto samples = source_.samplesForDays(kind, first, last);

    double sum = 0.0;
    QSet<QDate> days;
    for (const auto &sample : samples) {
        const QDate day = sampleDay(sample);
        // Guard against sources that return more than was asked for.
        if (day < first || day > last) {
            continue;
        }
        sum += sample.value;
        days.insert(day);
        ++baseline.sampleCount;
    }
    baseline.coveredDays = static_cast<int>(days.size());

    if (baseline.sampleCount > 0 && baseline.sampleCount >= config_.minCoverage) {
        baseline.status = BaselineStatus::Available;
        baseline.aggregate = sum / baseline.sampleCount;
    } else {
        qDebug() << "BaselineTracker:" << metricKindToString(kind)
                 << "insufficient coverage for" << dayToString(asOf)
                 << "-" << baseline.sampleCount << "samples";
    }

    return baseline;
}

} // namespace kvital
