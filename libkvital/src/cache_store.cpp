#include "kvital/cache_store.hpp"

#include "kvital/common.hpp"

#include <QDebug>
#include <QThread>
#include <QtConcurrent/QtConcurrentRun>

#include <algorithm>
#include <map>

namespace kvital {

CacheStore::CacheStore(std::unique_ptr<DurableScoreStore> durable,
                       CacheConfig config,
                       QObject *parent)
    : QObject(parent)
    , durable_(std::move(durable))
    , config_(config)
{
    qRegisterMetaType<kvital::ScoreKey>();
    qRegisterMetaType<kvital::CompositeScore>();

    if (config_.capacity < 1) {
        qWarning() << "CacheStore: capacity" << config_.capacity << "is invalid, using 1";
        config_.capacity = 1;
    }

    // A single writer keeps durable writes in submission order.
    writerPool_.setMaxThreadCount(1);
}

CacheStore::~CacheStore()
{
    flush();
}

std::optional<CompositeScore> CacheStore::get(const ScoreKey &key)
{
    {
        QMutexLocker lock(&mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            stats_.hits++;
            touchLocked(*it);
            return it->entry.value;
        }
        stats_.misses++;
    }

    // Evicted from memory but not yet durable.
    std::optional<CompositeScore> value = unsyncedValue(key);
    if (!value && durable_) {
        value = durable_->readScore(key);
    }
    if (!value) {
        return std::nullopt;
    }

    QMutexLocker lock(&mutex_);
    if (!entries_.contains(key)) {
        insertLocked(key, *value, QDateTime());
    }
    return value;
}

void CacheStore::put(const ScoreKey &key, const CompositeScore &value)
{
    // The write sequence is taken while the memory tier is still locked, so
    // the last value in memory is also the last one written durably.
    QMutexLocker lock(&mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->entry.value = value;
        it->entry.lastComputedAt = value.computedAt;
        it->entry.lastPublishedAt = nowUtc();
        it->entry.stale = false;
        touchLocked(*it);
    } else {
        insertLocked(key, value, nowUtc());
    }

    QMutexLocker writeLock(&writeMutex_);
    failedWrites_.remove(key);
    pendingWrites_.insert(key, PendingWrite{value, nextSequence_++});
    scheduleDrainLocked();
}

void CacheStore::invalidate(const ScoreKey &key)
{
    QMutexLocker lock(&mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->entry.stale = true;
    }
}

std::optional<CacheEntry> CacheStore::entry(const ScoreKey &key) const
{
    QMutexLocker lock(&mutex_);
    auto it = entries_.constFind(key);
    if (it == entries_.constEnd()) {
        return std::nullopt;
    }
    return it->entry;
}

bool CacheStore::isStale(const ScoreKey &key) const
{
    QMutexLocker lock(&mutex_);
    auto it = entries_.constFind(key);
    return it != entries_.constEnd() && it->entry.stale;
}

bool CacheStore::contains(const ScoreKey &key)
{
    {
        QMutexLocker lock(&mutex_);
        if (entries_.contains(key)) {
            return true;
        }
    }
    if (unsyncedValue(key)) {
        return true;
    }
    return durable_ && durable_->readScore(key).has_value();
}

std::vector<CompositeScore> CacheStore::listRecent(ScoreKind kind, int offset, int limit)
{
    std::vector<CompositeScore> results;
    if (limit <= 0) {
        return results;
    }
    offset = std::max(0, offset);

    // Durable rows first, then overlay anything newer held in memory or
    // still waiting to be written.
    std::map<QDate, CompositeScore> merged;
    if (durable_) {
        for (auto &score : durable_->listRecent(kind, 0, offset + limit)) {
            const QDate day = score.day;
            merged[day] = std::move(score);
        }
    }

    {
        QMutexLocker lock(&writeMutex_);
        for (auto it = failedWrites_.cbegin(); it != failedWrites_.cend(); ++it) {
            if (it.key().kind == kind) {
                merged[it.key().day] = it.value();
            }
        }
        for (auto it = pendingWrites_.cbegin(); it != pendingWrites_.cend(); ++it) {
            if (it.key().kind == kind) {
                merged[it.key().day] = it.value().score;
            }
        }
    }

    {
        QMutexLocker lock(&mutex_);
        for (const Node &node : std::as_const(entries_)) {
            if (node.entry.key.kind == kind) {
                merged[node.entry.key.day] = node.entry.value;
            }
        }
    }

    int index = 0;
    for (auto it = merged.rbegin(); it != merged.rend(); ++it, ++index) {
        if (index < offset) {
            continue;
        }
        if (static_cast<int>(results.size()) >= limit) {
            break;
        }
        results.push_back(it->second);
    }

    return results;
}

void CacheStore::retryFailedWrites()
{
    QMutexLocker lock(&writeMutex_);
    if (failedWrites_.isEmpty()) {
        return;
    }

    qInfo() << "CacheStore: retrying" << failedWrites_.size() << "failed durable writes";
    for (auto it = failedWrites_.cbegin(); it != failedWrites_.cend(); ++it) {
        if (!pendingWrites_.contains(it.key())) {
            pendingWrites_.insert(it.key(), PendingWrite{it.value(), nextSequence_++});
        }
    }
    failedWrites_.clear();
    scheduleDrainLocked();
}

void CacheStore::flush()
{
    writerPool_.waitForDone();
}

CacheStats CacheStore::stats() const
{
    QMutexLocker lock(&mutex_);
    return stats_;
}

int CacheStore::size() const
{
    QMutexLocker lock(&mutex_);
    return static_cast<int>(entries_.size());
}

int CacheStore::pendingWriteCount() const
{
    QMutexLocker lock(&writeMutex_);
    return static_cast<int>(pendingWrites_.size());
}

void CacheStore::insertLocked(const ScoreKey &key, const CompositeScore &value,
                              const QDateTime &publishedAt)
{
    lru_.push_front(key);

    Node node;
    node.entry.key = key;
    node.entry.value = value;
    node.entry.lastComputedAt = value.computedAt;
    node.entry.lastPublishedAt = publishedAt;
    node.position = lru_.begin();
    entries_.insert(key, node);

    evictLocked();
}

void CacheStore::touchLocked(Node &node)
{
    lru_.splice(lru_.begin(), lru_, node.position);
    node.position = lru_.begin();
}

void CacheStore::evictLocked()
{
    while (static_cast<int>(entries_.size()) > config_.capacity && !lru_.empty()) {
        const ScoreKey victim = lru_.back();
        lru_.pop_back();
        entries_.remove(victim);
        stats_.evictions++;
    }
}

void CacheStore::scheduleDrainLocked()
{
    if (drainScheduled_ || pendingWrites_.isEmpty()) {
        return;
    }
    drainScheduled_ = true;
    // The future is not needed: completion is observed through flush().
    (void)QtConcurrent::run(&writerPool_, [this]() { drainWrites(); });
}

void CacheStore::drainWrites()
{
    for (;;) {
        ScoreKey key;
        PendingWrite write;
        {
            QMutexLocker lock(&writeMutex_);
            if (pendingWrites_.isEmpty()) {
                drainScheduled_ = false;
                return;
            }
            auto it = pendingWrites_.cbegin();
            key = it.key();
            write = it.value();
        }

        QString error;
        const bool ok = writeWithRetry(write.score, &error);

        bool failed = false;
        {
            QMutexLocker lock(&writeMutex_);
            auto it = pendingWrites_.find(key);
            const bool superseded = it == pendingWrites_.end() || it->sequence != write.sequence;
            if (!superseded) {
                pendingWrites_.erase(it);
                if (!ok) {
                    failedWrites_.insert(key, write.score);
                    failed = true;
                }
            }
        }

        {
            QMutexLocker lock(&mutex_);
            if (ok) {
                stats_.durableWrites++;
            } else {
                stats_.durableWriteFailures++;
            }
        }

        if (failed) {
            qWarning() << "CacheStore: giving up on durable write for"
                       << scoreKeyToString(key) << "-" << error;
            emit durableWriteFailed(key, error);
        }
    }
}

bool CacheStore::writeWithRetry(const CompositeScore &score, QString *error)
{
    if (!durable_) {
        if (error) {
            *error = QStringLiteral("no durable tier configured");
        }
        return false;
    }

    int delayMs = config_.retryBaseDelayMs;
    for (int attempt = 0;; ++attempt) {
        if (durable_->writeScore(score, error)) {
            return true;
        }
        if (attempt >= config_.maxWriteRetries) {
            return false;
        }

        qWarning() << "CacheStore: durable write for" << scoreKeyToString(keyOf(score))
                   << "failed, retrying in" << delayMs << "ms -"
                   << (error ? *error : QString());
        QThread::msleep(static_cast<unsigned long>(std::max(0, delayMs)));
        delayMs *= 2;
    }
}

std::optional<CompositeScore> CacheStore::unsyncedValue(const ScoreKey &key) const
{
    QMutexLocker lock(&writeMutex_);
    auto pending = pendingWrites_.constFind(key);
    if (pending != pendingWrites_.constEnd()) {
        return pending->score;
    }
    auto failed = failedWrites_.constFind(key);
    if (failed != failedWrites_.constEnd()) {
        return *failed;
    }
    return std::nullopt;
}

} // namespace kvital
