#pragma once

#include <QDateTime>
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QThreadPool>
#include <list>
#include <memory>
#include <optional>
#include <vector>

#include "kvital/score.hpp"
#include "kvital/score_archive.hpp"

namespace kvital {

struct CacheConfig
{
    int capacity = 100;          // in-memory entries
    int maxWriteRetries = 5;
    int retryBaseDelayMs = 200;  // doubles on every retry
};

struct CacheEntry
{
    ScoreKey       key;
    CompositeScore value;
    QDateTime      lastComputedAt;
    QDateTime      lastPublishedAt;   // invalid when loaded from the durable tier
    bool           stale = false;
};

struct CacheStats
{
    quint64 hits = 0;
    quint64 misses = 0;
    quint64 evictions = 0;
    quint64 durableWrites = 0;
    quint64 durableWriteFailures = 0;
};

// Two-tier score cache: a bounded LRU in memory in front of a durable
// store. put() is visible to readers immediately; the durable write runs
// later on a dedicated writer thread, coalesced per key and retried with
// exponential backoff.
class CacheStore : public QObject
{
    Q_OBJECT
public:
    explicit CacheStore(std::unique_ptr<DurableScoreStore> durable,
                        CacheConfig config = {},
                        QObject *parent = nullptr);
    ~CacheStore() override;

    std::optional<CompositeScore> get(const ScoreKey &key);
    void put(const ScoreKey &key, const CompositeScore &value);

    // Mark the in-memory entry stale. The value stays readable until a
    // newer one is put.
    void invalidate(const ScoreKey &key);

    // In-memory entry, without touching recency or statistics.
    std::optional<CacheEntry> entry(const ScoreKey &key) const;
    bool isStale(const ScoreKey &key) const;

    // True if any tier holds a value for `key`. Does not count as an access.
    bool contains(const ScoreKey &key);

    // Most recent day first, merged across both tiers.
    std::vector<CompositeScore> listRecent(ScoreKind kind, int offset, int limit);

    // Re-queue writes that exhausted their retries.
    void retryFailedWrites();

    // Block until every queued durable write has settled.
    void flush();

    CacheStats stats() const;
    int size() const;
    int capacity() const { return config_.capacity; }
    int pendingWriteCount() const;

signals:
    void durableWriteFailed(const kvital::ScoreKey &key, const QString &error);

private:
    struct Node {
        CacheEntry entry;
        std::list<ScoreKey>::iterator position;
    };

    struct PendingWrite {
        CompositeScore score;
        quint64 sequence = 0;
    };

    void insertLocked(const ScoreKey &key, const CompositeScore &value, const QDateTime &publishedAt);
    void touchLocked(Node &node);
    void evictLocked();

    void scheduleDrainLocked();
    void drainWrites();
    bool writeWithRetry(const CompositeScore &score, QString *error);
    std::optional<CompositeScore> unsyncedValue(const ScoreKey &key) const;

    std::unique_ptr<DurableScoreStore> durable_;
    CacheConfig config_;

    // Memory tier
    mutable QMutex mutex_;
    std::list<ScoreKey> lru_;   // front is most recently used
    QHash<ScoreKey, Node> entries_;
    CacheStats stats_;

    // Durable write queue. Taken after mutex_ when both are held.
    mutable QMutex writeMutex_;
    QHash<ScoreKey, PendingWrite> pendingWrites_;
    QHash<ScoreKey, CompositeScore> failedWrites_;
    quint64 nextSequence_ = 1;
    bool drainScheduled_ = false;
    QThreadPool writerPool_;
};

} // namespace kvital
