#include "kvital_daemon.hpp"

#include "kvital/common.hpp"

#include <QDBusConnection>
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>

#include "kvital_daemon_adaptor.h"

namespace kvital {

namespace {

std::unique_ptr<DurableScoreStore> makeArchive(const QString &dbPath, ScoreArchive **out)
{
    auto archive = std::make_unique<ScoreArchive>(dbPath);
    *out = archive.get();
    return archive;
}

} // namespace

KVitalDaemon::KVitalDaemon(const DaemonConfig &config, const QString &dbPath, QObject *parent)
    : QObject(parent)
    , config_(config)
    , dbPath_(dbPath)
    , sampleStore_(dbPath)
    , baselines_(sampleStore_, config.baseline)
    , engine_(config.scoring)
    , cache_(makeArchive(dbPath, &archive_), config.cache)
    , coordinator_(cache_, baselines_, sampleStore_, engine_, config.coordinator)
    , feed_(this)
    , watcher_(coordinator_, cache_)
{
    connect(&feed_, &SampleFeedReader::samplesReceived,
            this, &KVitalDaemon::handleSamples);
    connect(&coordinator_, &UpdateCoordinator::scorePublished,
            this, &KVitalDaemon::handleScorePublished);

    // Relays ScoreUpdated and forwards the method calls.
    new DaemonAdaptor(this);
}

KVitalDaemon::~KVitalDaemon()
{
    feed_.stop();
    watcher_.stop();
    cache_.flush();
}

bool KVitalDaemon::init()
{
    if (!sampleStore_.open() || !sampleStore_.initSchema()) {
        qWarning() << "KVitalDaemon: failed to initialise sample store at" << dbPath_;
        return false;
    }
    if (!archive_->open() || !archive_->initSchema()) {
        qWarning() << "KVitalDaemon: failed to initialise score archive at" << dbPath_;
        return false;
    }

    if (!config_.feed.command.isEmpty()) {
        if (!feed_.start(config_.feed.command, config_.feed.arguments)) {
            // Not fatal: samples can still arrive through InjectSamples.
            qWarning() << "KVitalDaemon: sample feed failed to start";
        }
    } else {
        qInfo() << "KVitalDaemon: no sample feed configured, waiting for InjectSamples";
    }

    watcher_.start(config_.coordinator.retryIntervalMinutes);

    // Anything left incomplete before a restart gets another pass.
    watcher_.check();
    return true;
}

bool KVitalDaemon::checkedKind(const QString &name, ScoreKind *out)
{
    const auto kind = scoreKindFromString(name);
    if (!kind) {
        qWarning() << "KVitalDaemon: unknown score kind" << name;
        return false;
    }
    *out = *kind;
    return true;
}

bool KVitalDaemon::checkedDay(const QString &text, QDate *out)
{
    const QDate day = text.isEmpty() ? coordinator_.today() : dayFromString(text);
    if (!day.isValid()) {
        qWarning() << "KVitalDaemon: invalid day" << text;
        return false;
    }
    *out = day;
    return true;
}

QString KVitalDaemon::CurrentScore(const QString &kind, const QString &day)
{
    ScoreKind scoreKind;
    QDate date;
    if (!checkedKind(kind, &scoreKind) || !checkedDay(day, &date)) {
        return QString();
    }

    const auto score = coordinator_.currentScore(scoreKind, date);
    return score ? scoreToJsonString(*score) : QString();
}

QString KVitalDaemon::History(const QString &kind, int rangeDays)
{
    QJsonArray arr;

    ScoreKind scoreKind;
    if (checkedKind(kind, &scoreKind)) {
        for (const auto &score : coordinator_.history(scoreKind, rangeDays)) {
            arr.push_back(scoreToJson(score));
        }
    }

    return QString::fromUtf8(QJsonDocument(arr).toJson(QJsonDocument::Compact));
}

QString KVitalDaemon::FreshnessStatus(const QString &kind, const QString &day)
{
    ScoreKind scoreKind;
    QDate date;
    if (!checkedKind(kind, &scoreKind) || !checkedDay(day, &date)) {
        return QString();
    }

    return freshnessStatusToString(coordinator_.freshnessStatus(ScoreKey{date, scoreKind}));
}

QString KVitalDaemon::Baseline(const QString &metric, const QString &asOf)
{
    const auto kind = metricKindFromString(metric);
    if (!kind) {
        qWarning() << "KVitalDaemon: unknown metric" << metric;
        return QString();
    }
    QDate date;
    if (!checkedDay(asOf, &date)) {
        return QString();
    }

    const auto baseline = coordinator_.baseline(*kind, date);
    if (!baseline) {
        return QString();
    }
    return QString::fromUtf8(QJsonDocument(baselineToJson(*baseline)).toJson(QJsonDocument::Compact));
}

void KVitalDaemon::InjectSamples(const QString &samplesJson)
{
    const auto samples = samplesFromJsonString(samplesJson);
    if (samples.empty()) {
        qWarning() << "KVitalDaemon: InjectSamples carried no usable samples";
        return;
    }
    handleSamples(samples);
}

void KVitalDaemon::handleSamples(const std::vector<kvital::BiometricSample> &samples)
{
    int inserted = 0;
    if (!sampleStore_.insertSamples(samples, &inserted)) {
        qWarning() << "KVitalDaemon: failed to store" << samples.size() << "samples";
        return;
    }

    if (inserted == 0) {
        qDebug() << "KVitalDaemon: batch of" << samples.size() << "samples already known";
    }

    // Forwarded even when nothing was new; the coordinator is idempotent.
    coordinator_.onSamplesArrived(samples);
}

void KVitalDaemon::handleScorePublished(const kvital::ScoreKey &key,
                                        const kvital::CompositeScore &score)
{
    Q_UNUSED(key);
    emit ScoreUpdated(scoreToJsonString(score));
}

} // namespace kvital
