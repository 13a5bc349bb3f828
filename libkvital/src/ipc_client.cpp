#include "kvital/ipc_client.hpp"

#include "kvital/common.hpp"

#include <QDBusConnection>
#include <QDBusError>
#include <QDBusInterface>
#include <QDBusReply>
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>

namespace {

constexpr const char *kSignalScoreUpdated = "ScoreUpdated";

} // namespace

namespace kvital {

IpcClient::IpcClient(QObject *parent)
    : QObject(parent)
{
}

IpcClient::~IpcClient()
{
    delete iface_;
    iface_ = nullptr;
}

void IpcClient::setConnected(bool c)
{
    if (connected_ == c)
        return;
    connected_ = c;
    emit connectionChanged(connected_);
}

bool IpcClient::connectToDaemon()
{
    delete iface_;
    iface_ = nullptr;

    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        lastError_ = QStringLiteral("DBus session bus not connected");
        setConnected(false);
        return false;
    }

    iface_ = new QDBusInterface(
        QString::fromUtf8(DaemonServiceName),
        QString::fromUtf8(DaemonObjectPath),
        QString::fromUtf8(DaemonInterface),
        bus,
        this
    );

    if (!iface_->isValid()) {
        lastError_ = QStringLiteral("Failed to create DBus interface: %1")
                         .arg(iface_->lastError().message());
        qWarning() << "IpcClient:" << lastError_;
        delete iface_;
        iface_ = nullptr;
        setConnected(false);
        return false;
    }

    const bool ok = bus.connect(
        QString::fromUtf8(DaemonServiceName),
        QString::fromUtf8(DaemonObjectPath),
        QString::fromUtf8(DaemonInterface),
        QString::fromUtf8(kSignalScoreUpdated),
        this,
        SLOT(handleScoreJson(QString))
    );

    lastError_.clear();
    if (!ok) {
        // Queries still work without push updates.
        qWarning() << "IpcClient: failed to connect to ScoreUpdated signal";
    }

    setConnected(true);
    return true;
}

bool IpcClient::ensureConnected()
{
    return iface_ || connectToDaemon();
}

std::optional<CompositeScore> IpcClient::currentScore(ScoreKind kind, const QDate &day)
{
    if (!ensureConnected()) {
        return std::nullopt;
    }

    QDBusReply<QString> reply = iface_->call(QStringLiteral("CurrentScore"),
                                             scoreKindToString(kind),
                                             dayToString(day));
    if (!reply.isValid()) {
        lastError_ = reply.error().message();
        qWarning() << "IpcClient: CurrentScore failed:" << lastError_;
        setConnected(false);
        return std::nullopt;
    }

    lastError_.clear();
    if (reply.value().isEmpty()) {
        return std::nullopt;
    }

    auto score = scoreFromJsonString(reply.value());
    if (!score) {
        lastError_ = QStringLiteral("CurrentScore returned malformed JSON");
        qWarning() << "IpcClient:" << lastError_;
    }
    return score;
}

std::vector<CompositeScore> IpcClient::history(ScoreKind kind, int rangeDays)
{
    std::vector<CompositeScore> results;

    if (!ensureConnected()) {
        return results;
    }

    QDBusReply<QString> reply = iface_->call(QStringLiteral("History"),
                                             scoreKindToString(kind),
                                             rangeDays);
    if (!reply.isValid()) {
        lastError_ = reply.error().message();
        qWarning() << "IpcClient: History failed:" << lastError_;
        setConnected(false);
        return results;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(reply.value().toUtf8());
    if (!doc.isArray()) {
        lastError_ = QStringLiteral("History returned non-array JSON");
        qWarning() << "IpcClient:" << lastError_;
        return results;
    }

    const QJsonArray arr = doc.array();
    results.reserve(arr.size());
    for (const QJsonValue &v : arr) {
        if (!v.isObject())
            continue;
        if (auto score = scoreFromJson(v.toObject())) {
            results.push_back(std::move(*score));
        }
    }

    lastError_.clear();
    return results;
}

std::optional<FreshnessStatus> IpcClient::freshnessStatus(ScoreKind kind, const QDate &day)
{
    if (!ensureConnected()) {
        return std::nullopt;
    }

    QDBusReply<QString> reply = iface_->call(QStringLiteral("FreshnessStatus"),
                                             scoreKindToString(kind),
                                             dayToString(day));
    if (!reply.isValid()) {
        lastError_ = reply.error().message();
        qWarning() << "IpcClient: FreshnessStatus failed:" << lastError_;
        setConnected(false);
        return std::nullopt;
    }

    const auto status = freshnessStatusFromString(reply.value());
    if (!status) {
        lastError_ = QStringLiteral("Unknown freshness status '%1'").arg(reply.value());
        qWarning() << "IpcClient:" << lastError_;
        return std::nullopt;
    }

    lastError_.clear();
    return status;
}

std::optional<QJsonObject> IpcClient::baseline(MetricKind metric, const QDate &asOf)
{
    if (!ensureConnected()) {
        return std::nullopt;
    }

    QDBusReply<QString> reply = iface_->call(QStringLiteral("Baseline"),
                                             metricKindToString(metric),
                                             dayToString(asOf));
    if (!reply.isValid()) {
        lastError_ = reply.error().message();
        qWarning() << "IpcClient: Baseline failed:" << lastError_;
        setConnected(false);
        return std::nullopt;
    }

    lastError_.clear();
    if (reply.value().isEmpty()) {
        return std::nullopt;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(reply.value().toUtf8());
    if (!doc.isObject()) {
        lastError_ = QStringLiteral("Baseline returned non-object JSON");
        qWarning() << "IpcClient:" << lastError_;
        return std::nullopt;
    }
    return doc.object();
}

bool IpcClient::injectSamples(const std::vector<BiometricSample> &samples)
{
    if (!ensureConnected()) {
        return false;
    }

    QDBusReply<void> reply = iface_->call(QStringLiteral("InjectSamples"),
                                          samplesToJsonString(samples));
    if (!reply.isValid()) {
        lastError_ = reply.error().message();
        qWarning() << "IpcClient: InjectSamples failed:" << lastError_;
        setConnected(false);
        return false;
    }

    lastError_.clear();
    return true;
}

void IpcClient::handleScoreJson(const QString &json)
{
    auto score = scoreFromJsonString(json);
    if (!score)
        return;

    emit scoreUpdated(*score);
}

} // namespace kvital
