#include "kvital/config.hpp"

#include <QDebug>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>

namespace kvital {

namespace {

int readInt(QSettings &settings, const char *key, int fallback, int min, int max)
{
    const QString name = QString::fromLatin1(key);
    if (!settings.contains(name)) {
        return fallback;
    }

    bool ok = false;
    const int value = settings.value(name).toInt(&ok);
    if (!ok || value < min || value > max) {
        qWarning().nospace() << "Config: " << settings.group() << "/" << name
                             << " = " << settings.value(name).toString()
                             << " is out of range [" << min << ", " << max
                             << "], using " << fallback;
        return fallback;
    }
    return value;
}

double readDouble(QSettings &settings, const char *key, double fallback, double min, double max)
{
    const QString name = QString::fromLatin1(key);
    if (!settings.contains(name)) {
        return fallback;
    }

    bool ok = false;
    const double value = settings.value(name).toDouble(&ok);
    if (!ok || !(value >= min && value <= max)) {
        qWarning().nospace() << "Config: " << settings.group() << "/" << name
                             << " = " << settings.value(name).toString()
                             << " is out of range [" << min << ", " << max
                             << "], using " << fallback;
        return fallback;
    }
    return value;
}

} // namespace

QString defaultConfigPath()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation)
        + QStringLiteral("/kvitald.conf");
}

DaemonConfig loadConfig(const QString &path)
{
    DaemonConfig config;

    if (path.isEmpty() || !QFileInfo::exists(path)) {
        qInfo() << "Config: no config file at" << path << "- using defaults";
        return config;
    }

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qWarning() << "Config: failed to parse" << path << "- using defaults";
        return config;
    }

    settings.beginGroup(QStringLiteral("baseline"));
    config.baseline.windowDays = readInt(settings, "windowDays", config.baseline.windowDays, 1, 365);
    config.baseline.minCoverage = readInt(settings, "minCoverage", config.baseline.minCoverage, 1, 10000);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("curve"));
    GrowthCurveConfig curve;
    curve.anchorScore = readDouble(settings, "anchorScore", curve.anchorScore, 1.0, 99.0);
    curve.upperRate = readDouble(settings, "upperRate", curve.upperRate, 0.01, 100.0);
    curve.lowerExponent = readDouble(settings, "lowerExponent", curve.lowerExponent, 0.01, 100.0);
    settings.endGroup();
    if (isValid(curve)) {
        config.scoring.curve = curve;
    } else {
        qWarning() << "Config: growth curve settings rejected, using defaults";
    }

    settings.beginGroup(QStringLiteral("cache"));
    config.cache.capacity = readInt(settings, "capacity", config.cache.capacity, 1, 1000000);
    config.cache.maxWriteRetries = readInt(settings, "maxWriteRetries", config.cache.maxWriteRetries, 0, 20);
    config.cache.retryBaseDelayMs = readInt(settings, "retryBaseDelayMs", config.cache.retryBaseDelayMs, 0, 60000);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("coordinator"));
    config.coordinator.workerThreads = readInt(settings, "workerThreads", config.coordinator.workerThreads, 1, 64);
    config.coordinator.recentWindowMinutes = readInt(settings, "recentWindowMinutes", config.coordinator.recentWindowMinutes, 1, 24 * 60);
    config.coordinator.retryIntervalMinutes = readInt(settings, "retryIntervalMinutes", config.coordinator.retryIntervalMinutes, 1, 24 * 60);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("feed"));
    config.feed.command = settings.value(QStringLiteral("command")).toString().trimmed();
    config.feed.arguments = settings.value(QStringLiteral("arguments")).toStringList();
    settings.endGroup();

    settings.beginGroup(QStringLiteral("storage"));
    config.databasePath = settings.value(QStringLiteral("path")).toString().trimmed();
    settings.endGroup();

    return config;
}

} // namespace kvital
