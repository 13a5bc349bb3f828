#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDBusConnection>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

#include "kvital/config.hpp"
#include "kvital/ipc_client.hpp"

#include "kvital_daemon.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("kvitald"));
    app.setApplicationVersion(QStringLiteral("0.1"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("KVital score daemon"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(
        QStringLiteral("config"),
        QStringLiteral("Read settings from <file>."),
        QStringLiteral("file"),
        kvital::defaultConfigPath());
    const QCommandLineOption dbOption(
        QStringLiteral("db"),
        QStringLiteral("Store samples and scores in <path>."),
        QStringLiteral("path"));
    const QCommandLineOption feedOption(
        QStringLiteral("feed"),
        QStringLiteral("Read samples from the output of <command>."),
        QStringLiteral("command"));
    parser.addOption(configOption);
    parser.addOption(dbOption);
    parser.addOption(feedOption);
    parser.process(app);

    kvital::DaemonConfig config = kvital::loadConfig(parser.value(configOption));

    if (parser.isSet(feedOption)) {
        config.feed.command = parser.value(feedOption);
        config.feed.arguments.clear();
    }

    QString dbPath = parser.isSet(dbOption) ? parser.value(dbOption) : config.databasePath;
    if (dbPath.isEmpty()) {
        const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
        dbPath = dataDir + QStringLiteral("/kvital.db");
    }
    QDir().mkpath(QFileInfo(dbPath).absolutePath());

    qInfo() << "KVital daemon starting, DB path:" << dbPath;

    kvital::KVitalDaemon daemon(config, dbPath);
    if (!daemon.init()) {
        qCritical() << "Failed to initialize KVitalDaemon";
        return 1;
    }

    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.registerService(QString::fromUtf8(kvital::DaemonServiceName))) {
        qCritical() << "Failed to register D-Bus service" << kvital::DaemonServiceName;
        return 1;
    }

    if (!bus.registerObject(QString::fromUtf8(kvital::DaemonObjectPath), &daemon,
                            QDBusConnection::ExportAdaptors)) {
        qCritical() << "Failed to register D-Bus object" << kvital::DaemonObjectPath;
        return 1;
    }

    qInfo() << "KVital daemon initialized and D-Bus service registered";
    return app.exec();
}
