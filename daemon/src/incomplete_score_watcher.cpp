#include "incomplete_score_watcher.hpp"

#include "kvital/cache_store.hpp"
#include "kvital/update_coordinator.hpp"

#include <QDebug>

namespace kvital {

IncompleteScoreWatcher::IncompleteScoreWatcher(UpdateCoordinator &coordinator,
                                               CacheStore &cache,
                                               QObject *parent)
    : QObject(parent)
    , coordinator_(coordinator)
    , cache_(cache)
{
    timer_.setParent(this);
    connect(&timer_, &QTimer::timeout, this, &IncompleteScoreWatcher::check);
}

void IncompleteScoreWatcher::start(int intervalMinutes)
{
    timer_.start(intervalMinutes * 60 * 1000);
}

void IncompleteScoreWatcher::stop()
{
    timer_.stop();
}

void IncompleteScoreWatcher::check()
{
    cache_.retryFailedWrites();

    const QDate today = coordinator_.today();
    int requeued = 0;
    for (const QDate &day : {today.addDays(-1), today}) {
        for (ScoreKind kind : allScoreKinds()) {
            const ScoreKey key{day, kind};
            if (coordinator_.state(key) != KeyState::Idle) {
                continue;
            }
            // Never-scored days are left to the sample feed.
            const auto score = cache_.get(key);
            if (!score || score->dataComplete) {
                continue;
            }
            coordinator_.invalidate(key);
            ++requeued;
        }
    }

    if (requeued > 0) {
        qDebug() << "IncompleteScoreWatcher: requeued" << requeued << "incomplete scores";
    }
}

} // namespace kvital
