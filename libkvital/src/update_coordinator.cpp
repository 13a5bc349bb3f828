#include "kvital/update_coordinator.hpp"

#include "kvital/common.hpp"

#include <QDebug>
#include <QMetaObject>
#include <QtConcurrent/QtConcurrentRun>

#include <algorithm>
#include <utility>

namespace kvital {

namespace {
constexpr int kHistoryPageSize = 32;
} // namespace

QString keyStateToString(KeyState state)
{
    switch (state) {
    case KeyState::Idle:
        return QStringLiteral("idle");
    case KeyState::Invalidated:
        return QStringLiteral("invalidated");
    case KeyState::Computing:
        return QStringLiteral("computing");
    case KeyState::Superseded:
        return QStringLiteral("superseded");
    }

    return QStringLiteral("idle");
}

UpdateCoordinator::UpdateCoordinator(CacheStore &cache,
                                     BaselineTracker &baselines,
                                     SampleSource &source,
                                     const ScoringEngine &engine,
                                     CoordinatorConfig config,
                                     QObject *parent)
    : QObject(parent)
    , cache_(cache)
    , baselines_(baselines)
    , source_(source)
    , engine_(engine)
    , config_(config)
    , clock_(&nowUtc)
{
    qRegisterMetaType<kvital::ScoreKey>();
    qRegisterMetaType<kvital::CompositeScore>();
    qRegisterMetaType<kvital::KeyState>();

    pool_.setMaxThreadCount(std::max(1, config_.workerThreads));
}

UpdateCoordinator::~UpdateCoordinator()
{
    pool_.waitForDone();
}

void UpdateCoordinator::setClock(std::function<QDateTime()> clock)
{
    clock_ = clock ? std::move(clock) : std::function<QDateTime()>(&nowUtc);
}

QDateTime UpdateCoordinator::now() const
{
    return clock_();
}

QDate UpdateCoordinator::today() const
{
    return now().toLocalTime().date();
}

void UpdateCoordinator::onSamplesArrived(const std::vector<BiometricSample> &samples)
{
    pruneIdleRecords();

    // One pass per distinct (metric, day); a batch usually repeats both.
    std::set<std::pair<MetricKind, QDate>> touched;
    for (const auto &sample : samples) {
        const QDate day = sampleDay(sample);
        if (day.isValid()) {
            touched.emplace(sample.kind, day);
        }
    }

    std::set<ScoreKey> keys;
    for (const auto &[metric, day] : touched) {
        baselines_.invalidate(metric, day);
        const auto affected = affectedKeys(metric, day);
        keys.insert(affected.begin(), affected.end());
    }

    qDebug() << "UpdateCoordinator:" << samples.size() << "samples touched"
             << keys.size() << "keys";

    for (const ScoreKey &key : keys) {
        invalidate(key);
    }
}

std::set<ScoreKey> UpdateCoordinator::affectedKeys(MetricKind metric, const QDate &day)
{
    std::set<ScoreKey> keys;

    for (ScoreKind kind : allScoreKinds()) {
        if (ScoringEngine::metricAffects(metric, kind)) {
            keys.insert(ScoreKey{day, kind});
        }
    }

    // Later days only matter if they were already scored with the old
    // baseline, or are being scored with it right now.
    const QDate last = std::min(day.addDays(baselines_.config().windowDays), today());
    for (QDate d = day.addDays(1); d <= last; d = d.addDays(1)) {
        for (ScoreKind kind : allScoreKinds()) {
            const auto &inputs = ScoringEngine::baselineMetrics(kind);
            if (std::find(inputs.begin(), inputs.end(), metric) == inputs.end()) {
                continue;
            }
            const ScoreKey key{d, kind};
            if (state(key) != KeyState::Idle || cache_.contains(key)) {
                keys.insert(key);
            }
        }
    }

    return keys;
}

void UpdateCoordinator::invalidate(const ScoreKey &key)
{
    KeyRecord &record = keys_[key];

    switch (record.state) {
    case KeyState::Idle:
        cache_.invalidate(key);
        setState(key, record, KeyState::Invalidated);
        scheduleStart(key);
        break;
    case KeyState::Computing:
        cache_.invalidate(key);
        setState(key, record, KeyState::Superseded);
        break;
    case KeyState::Invalidated:
    case KeyState::Superseded:
        // Already pending.
        break;
    }
}

void UpdateCoordinator::scheduleStart(const ScoreKey &key)
{
    // Queued so that a burst of notifications settles before the first start.
    QMetaObject::invokeMethod(this, [this, key]() { startCompute(key); },
                              Qt::QueuedConnection);
}

void UpdateCoordinator::startCompute(const ScoreKey &key)
{
    auto it = keys_.find(key);
    if (it == keys_.end() || it->state != KeyState::Invalidated) {
        return;
    }

    setState(key, *it, KeyState::Computing);
    computationsStarted_++;

    const QDateTime computedAt = now();
    auto *watcher = new QFutureWatcher<CompositeScore>(this);
    connect(watcher, &QFutureWatcher<CompositeScore>::finished, this,
            [this, key, watcher]() { handleFinished(key, watcher); });

    watcher->setFuture(QtConcurrent::run(&pool_, [this, key, computedAt]() {
        return computeKey(key, computedAt);
    }));
}

void UpdateCoordinator::handleFinished(const ScoreKey &key,
                                       QFutureWatcher<CompositeScore> *watcher)
{
    watcher->deleteLater();

    auto it = keys_.find(key);
    if (it == keys_.end()) {
        return;
    }

    if (it->state == KeyState::Superseded) {
        qDebug() << "UpdateCoordinator: discarding superseded result for"
                 << scoreKeyToString(key);
        setState(key, *it, KeyState::Invalidated);
        scheduleStart(key);
        return;
    }

    if (it->state != KeyState::Computing) {
        qWarning() << "UpdateCoordinator: unexpected completion for"
                   << scoreKeyToString(key) << "in state" << keyStateToString(it->state);
        return;
    }

    const CompositeScore score = watcher->result();
    cache_.put(key, score);
    it->lastPublishedAt = now();
    setState(key, *it, KeyState::Idle);

    qInfo() << "UpdateCoordinator: published" << scoreKeyToString(key)
            << "overall" << score.overall
            << (score.dataComplete ? "complete" : "partial");
    emit scorePublished(key, score);
}

void UpdateCoordinator::setState(const ScoreKey &key, KeyRecord &record, KeyState state)
{
    if (record.state == state) {
        return;
    }

    const bool wasBusy = record.state != KeyState::Idle;
    const bool isBusy = state != KeyState::Idle;
    if (wasBusy != isBusy) {
        busyKeys_ += isBusy ? 1 : -1;
    }

    record.state = state;
    emit stateChanged(key, state);
}

CompositeScore UpdateCoordinator::computeKey(const ScoreKey &key,
                                             const QDateTime &computedAt) const
{
    // Runs on a worker thread: only thread-safe collaborators are touched.
    DayMetrics metrics;
    for (MetricKind metric : ScoringEngine::inputMetrics(key.kind)) {
        for (const auto &sample : source_.samplesForDays(metric, key.day, key.day)) {
            metrics.add(sample);
        }
    }

    BaselineSet baselines;
    for (MetricKind metric : ScoringEngine::baselineMetrics(key.kind)) {
        baselines.emplace(metric, baselines_.refreshBaseline(metric, key.day));
    }

    return engine_.computeScore(key.kind, key.day, metrics, baselines, computedAt);
}

KeyState UpdateCoordinator::state(const ScoreKey &key) const
{
    auto it = keys_.constFind(key);
    return it == keys_.constEnd() ? KeyState::Idle : it->state;
}

FreshnessStatus UpdateCoordinator::freshnessStatus(const ScoreKey &key)
{
    if (state(key) != KeyState::Idle) {
        return FreshnessStatus::Computing;
    }

    const auto score = cache_.get(key);
    if (!score) {
        return FreshnessStatus::WaitingForData;
    }

    auto it = keys_.constFind(key);
    if (it != keys_.constEnd() && it->lastPublishedAt.isValid()) {
        const qint64 age = it->lastPublishedAt.secsTo(now());
        if (age >= 0 && age < static_cast<qint64>(config_.recentWindowMinutes) * 60) {
            return FreshnessStatus::RecentlyUpdated;
        }
    }

    return score->dataComplete ? FreshnessStatus::Silent : FreshnessStatus::WaitingForData;
}

std::optional<CompositeScore> UpdateCoordinator::currentScore(ScoreKind kind, const QDate &day)
{
    return cache_.get(ScoreKey{day, kind});
}

std::vector<CompositeScore> UpdateCoordinator::history(ScoreKind kind, int rangeDays)
{
    std::vector<CompositeScore> results;
    if (rangeDays <= 0) {
        return results;
    }

    const QDate last = today();
    const QDate first = last.addDays(-(rangeDays - 1));

    for (int offset = 0;; offset += kHistoryPageSize) {
        const auto page = cache_.listRecent(kind, offset, kHistoryPageSize);
        for (const auto &score : page) {
            if (score.day < first) {
                return results;
            }
            if (score.day <= last) {
                results.push_back(score);
            }
        }
        if (static_cast<int>(page.size()) < kHistoryPageSize) {
            break;
        }
    }

    return results;
}

std::optional<Baseline> UpdateCoordinator::baseline(MetricKind metric, const QDate &asOf)
{
    if (!asOf.isValid()) {
        return std::nullopt;
    }
    return baselines_.refreshBaseline(metric, asOf);
}

void UpdateCoordinator::pruneIdleRecords()
{
    // Idle keys only carry their publish time, which stops mattering once
    // it falls out of the recent window.
    const QDateTime current = now();
    const qint64 window = static_cast<qint64>(config_.recentWindowMinutes) * 60;
    for (auto it = keys_.begin(); it != keys_.end();) {
        const bool expired = it->state == KeyState::Idle
            && (!it->lastPublishedAt.isValid() || it->lastPublishedAt.secsTo(current) >= window);
        if (expired) {
            it = keys_.erase(it);
        } else {
            ++it;
        }
    }
}

bool UpdateCoordinator::isIdle() const
{
    return busyKeys_ == 0;
}

} // namespace kvital
