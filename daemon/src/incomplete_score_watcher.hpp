#pragma once

#include <QObject>
#include <QTimer>

namespace kvital {

class CacheStore;
class UpdateCoordinator;

// Periodically re-invalidates today's and yesterday's scores that are still
// missing data, and gives failed durable writes another chance.
class IncompleteScoreWatcher : public QObject
{
    Q_OBJECT
public:
    IncompleteScoreWatcher(UpdateCoordinator &coordinator,
                           CacheStore &cache,
                           QObject *parent = nullptr);

    void start(int intervalMinutes);
    void stop();

public slots:
    // One pass; returns through the coordinator's signals.
    void check();

private:
    UpdateCoordinator &coordinator_;
    CacheStore &cache_;
    QTimer timer_;
};

} // namespace kvital
