#pragma once

#include <QDate>
#include <QJsonObject>
#include <QObject>
#include <QString>

#include <optional>
#include <vector>

#include "kvital/freshness.hpp"
#include "kvital/sample.hpp"
#include "kvital/score.hpp"

class QDBusInterface;

namespace kvital {

// D-Bus service, object path and interface exported by kvitald.
constexpr const char *DaemonServiceName = "org.kde.kvital.Daemon";
constexpr const char *DaemonObjectPath  = "/org/kde/kvital/Daemon";
constexpr const char *DaemonInterface   = "org.kde.kvital.Daemon";

class IpcClient : public QObject
{
    Q_OBJECT
public:
    explicit IpcClient(QObject *parent = nullptr);
    ~IpcClient() override;

    // Try to connect to kvitald on the session bus.
    // Returns true if the DBus interface looks valid.
    bool connectToDaemon();

    bool isConnected() const { return connected_; }
    QString lastError() const { return lastError_; }

    // Synchronous queries. On failure they return nullopt or an empty
    // vector and set lastError().
    std::optional<CompositeScore> currentScore(ScoreKind kind, const QDate &day);
    std::vector<CompositeScore> history(ScoreKind kind, int rangeDays);
    std::optional<FreshnessStatus> freshnessStatus(ScoreKind kind, const QDate &day);
    std::optional<QJsonObject> baseline(MetricKind metric, const QDate &asOf);

    bool injectSamples(const std::vector<BiometricSample> &samples);

signals:
    // Emitted whenever the daemon publishes a score.
    void scoreUpdated(const kvital::CompositeScore &score);

    // Emitted when connection state changes.
    void connectionChanged(bool connected);

private slots:
    void handleScoreJson(const QString &json);

private:
    void setConnected(bool c);
    bool ensureConnected();

    QDBusInterface *iface_ = nullptr;
    bool connected_ = false;
    QString lastError_;
};

} // namespace kvital
