#pragma once

#include <QObject>
#include <QString>

#include <memory>
#include <vector>

#include "kvital/baseline_tracker.hpp"
#include "kvital/cache_store.hpp"
#include "kvital/config.hpp"
#include "kvital/sample_store.hpp"
#include "kvital/scoring_engine.hpp"
#include "kvital/update_coordinator.hpp"

#include "incomplete_score_watcher.hpp"
#include "sample_feed_reader.hpp"

namespace kvital {

class KVitalDaemon : public QObject
{
    Q_OBJECT
public:
    KVitalDaemon(const DaemonConfig &config, const QString &dbPath, QObject *parent = nullptr);
    ~KVitalDaemon() override;

    // Open the stores, start the feed and the retry watcher.
    bool init();

public slots:
    // DBus-exposed methods used by the generated DaemonAdaptor.

    // Compact JSON of the score, or an empty string when there is none.
    QString CurrentScore(const QString &kind, const QString &day);
    // JSON array, most recent day first.
    QString History(const QString &kind, int rangeDays);
    // silent | recently_updated | waiting_for_data | computing
    QString FreshnessStatus(const QString &kind, const QString &day);
    QString Baseline(const QString &metric, const QString &asOf);
    void InjectSamples(const QString &samplesJson);

signals:
    // Mapped to the "ScoreUpdated" DBus signal.
    void ScoreUpdated(const QString &scoreJson);

private slots:
    void handleSamples(const std::vector<kvital::BiometricSample> &samples);
    void handleScorePublished(const kvital::ScoreKey &key, const kvital::CompositeScore &score);

private:
    bool checkedKind(const QString &name, ScoreKind *out);
    bool checkedDay(const QString &text, QDate *out);

    DaemonConfig config_;
    QString dbPath_;

    SampleStore sampleStore_;
    ScoreArchive *archive_ = nullptr;   // owned by cache_
    BaselineTracker baselines_;
    ScoringEngine engine_;
    CacheStore cache_;
    UpdateCoordinator coordinator_;
    SampleFeedReader feed_;
    IncompleteScoreWatcher watcher_;
};

} // namespace kvital
