#pragma once

#include <QMetaType>
#include <QString>
#include <optional>

namespace kvital {

// What a consumer should show next to a score.
enum class FreshnessStatus {
    Silent,            // current and complete, nothing to say
    RecentlyUpdated,   // published within the recent window
    WaitingForData,    // published but incomplete, more samples expected
    Computing          // invalidated or recompute in flight
};

QString freshnessStatusToString(FreshnessStatus status);
std::optional<FreshnessStatus> freshnessStatusFromString(const QString &s);

// Local hour before which missing data is most likely an unsynced watch.
constexpr int MorningSyncEndHour = 10;

// Status line for a score. Empty for Silent.
QString freshnessMessage(FreshnessStatus status, bool dataComplete, int localHour);

} // namespace kvital

Q_DECLARE_METATYPE(kvital::FreshnessStatus)
