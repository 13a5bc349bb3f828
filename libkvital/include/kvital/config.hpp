#pragma once

#include <QString>
#include <QStringList>

#include "kvital/baseline_tracker.hpp"
#include "kvital/cache_store.hpp"
#include "kvital/scoring_engine.hpp"
#include "kvital/update_coordinator.hpp"

namespace kvital {

struct FeedConfig
{
    QString command;          // empty: no external provider
    QStringList arguments;
};

// Everything kvitald can be tuned with.
struct DaemonConfig
{
    BaselineConfig baseline;
    ScoringConfig scoring;
    CacheConfig cache;
    CoordinatorConfig coordinator;
    FeedConfig feed;
    QString databasePath;     // empty: default data location
};

// Reads an INI file. Missing keys keep their defaults; out-of-range values
// are logged and replaced by the default. A missing file is not an error.
DaemonConfig loadConfig(const QString &path);

// Default location of the daemon's config file.
QString defaultConfigPath();

} // namespace kvital
