#pragma once

#include <QDate>
#include <QDateTime>
#include <QFutureWatcher>
#include <QHash>
#include <QObject>
#include <QThreadPool>
#include <functional>
#include <optional>
#include <set>
#include <vector>

#include "kvital/baseline_tracker.hpp"
#include "kvital/cache_store.hpp"
#include "kvital/freshness.hpp"
#include "kvital/sample.hpp"
#include "kvital/sample_source.hpp"
#include "kvital/score.hpp"
#include "kvital/scoring_engine.hpp"

namespace kvital {

struct CoordinatorConfig
{
    int workerThreads = 4;
    int recentWindowMinutes = 30;
    int retryIntervalMinutes = 15;
};

enum class KeyState {
    Idle,          // cached value is current
    Invalidated,   // recompute queued, not yet running
    Computing,     // recompute in flight
    Superseded     // invalidated again while computing; result will be discarded
};

QString keyStateToString(KeyState state);

// Drives recomputation of (day, kind) keys as samples arrive.
//
// Lives on the thread that runs its event loop; every public method must be
// called from that thread. Notifications only change per-key state and queue
// a start, the scoring itself runs on a private worker pool. At most one
// computation per key is in flight, and a result computed from inputs that
// were invalidated while it ran is never published.
class UpdateCoordinator : public QObject
{
    Q_OBJECT
public:
    UpdateCoordinator(CacheStore &cache,
                      BaselineTracker &baselines,
                      SampleSource &source,
                      const ScoringEngine &engine,
                      CoordinatorConfig config = {},
                      QObject *parent = nullptr);
    ~UpdateCoordinator() override;

    // Samples must already be readable from the sample source. Duplicate
    // notifications are harmless.
    void onSamplesArrived(const std::vector<BiometricSample> &samples);

    // Force a recompute of one key.
    void invalidate(const ScoreKey &key);

    // Keys a sample invalidates: its own day for every score it feeds, plus
    // later days (up to today) that use it in a baseline and are either
    // cached or being recomputed.
    std::set<ScoreKey> affectedKeys(MetricKind metric, const QDate &day);

    KeyState state(const ScoreKey &key) const;
    FreshnessStatus freshnessStatus(const ScoreKey &key);

    // Query side
    std::optional<CompositeScore> currentScore(ScoreKind kind, const QDate &day);
    std::vector<CompositeScore> history(ScoreKind kind, int rangeDays);
    // nullopt for an invalid day.
    std::optional<Baseline> baseline(MetricKind metric, const QDate &asOf);

    // True when no key is invalidated or computing.
    bool isIdle() const;

    // Number of computations started so far (diagnostics).
    int computationsStarted() const { return computationsStarted_; }

    // Keys with a state record; idle keys are dropped once their publish
    // time leaves the recent window.
    int trackedKeyCount() const { return static_cast<int>(keys_.size()); }

    // Replace the wall clock, for tests.
    void setClock(std::function<QDateTime()> clock);
    QDate today() const;

    const CoordinatorConfig &config() const { return config_; }

signals:
    void scorePublished(const kvital::ScoreKey &key, const kvital::CompositeScore &score);
    void stateChanged(const kvital::ScoreKey &key, kvital::KeyState state);

private:
    struct KeyRecord {
        KeyState state = KeyState::Idle;
        QDateTime lastPublishedAt;
    };

    void scheduleStart(const ScoreKey &key);
    void startCompute(const ScoreKey &key);
    void handleFinished(const ScoreKey &key, QFutureWatcher<CompositeScore> *watcher);
    void setState(const ScoreKey &key, KeyRecord &record, KeyState state);
    void pruneIdleRecords();

    CompositeScore computeKey(const ScoreKey &key, const QDateTime &computedAt) const;

    QDateTime now() const;

    CacheStore &cache_;
    BaselineTracker &baselines_;
    SampleSource &source_;
    const ScoringEngine &engine_;
    CoordinatorConfig config_;

    QHash<ScoreKey, KeyRecord> keys_;
    int busyKeys_ = 0;
    int computationsStarted_ = 0;

    std::function<QDateTime()> clock_;
    QThreadPool pool_;
};

} // namespace kvital

Q_DECLARE_METATYPE(kvital::KeyState)
