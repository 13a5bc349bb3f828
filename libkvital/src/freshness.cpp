#include "kvital/freshness.hpp"

namespace kvital {

QString freshnessStatusToString(FreshnessStatus status)
{
    switch (status) {
    case FreshnessStatus::Silent:
        return QStringLiteral("silent");
    case FreshnessStatus::RecentlyUpdated:
        return QStringLiteral("recently_updated");
    case FreshnessStatus::WaitingForData:
        return QStringLiteral("waiting_for_data");
    case FreshnessStatus::Computing:
        return QStringLiteral("computing");
    }

    return QStringLiteral("silent");
}

std::optional<FreshnessStatus> freshnessStatusFromString(const QString &s)
{
    const QString lower = s.trimmed().toLower();
    if (lower == QLatin1String("silent")) {
        return FreshnessStatus::Silent;
    }
    if (lower == QLatin1String("recently_updated")) {
        return FreshnessStatus::RecentlyUpdated;
    }
    if (lower == QLatin1String("waiting_for_data")) {
        return FreshnessStatus::WaitingForData;
    }
    if (lower == QLatin1String("computing")) {
        return FreshnessStatus::Computing;
    }
    return std::nullopt;
}

QString freshnessMessage(FreshnessStatus status, bool dataComplete, int localHour)
{
    switch (status) {
    case FreshnessStatus::Silent:
        return QString();
    case FreshnessStatus::RecentlyUpdated:
        return dataComplete
            ? QStringLiteral("Score updated with complete data")
            : QStringLiteral("Score updated, monitoring for more data");
    case FreshnessStatus::WaitingForData:
        return localHour < MorningSyncEndHour
            ? QStringLiteral("Waiting for watch sync")
            : QStringLiteral("Monitoring for health data updates");
    case FreshnessStatus::Computing:
        return QStringLiteral("Updating score");
    }

    return QString();
}

} // namespace kvital
