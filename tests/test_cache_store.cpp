#include <QtTest>
#include <QSignalSpy>
#include <QtConcurrent/QtConcurrentRun>

#include "kvital/cache_store.hpp"

#include "fakes.hpp"

using namespace kvital;
using kvital::testing::MemoryScoreStore;

namespace {

const QDate kDay(2024, 3, 15);

CompositeScore makeScore(const QDate &day, ScoreKind kind, int overall)
{
    CompositeScore score;
    score.kind = kind;
    score.day = day;
    score.overall = overall;
    score.dataComplete = true;
    score.computedAt = QDateTime(day, QTime(9, 0)).toUTC();

    ScoreComponent c;
    c.name = QStringLiteral("hrv");
    c.weight = 1.0;
    c.normalizedValue = overall;
    c.contribution = overall;
    c.complete = true;
    score.components.push_back(c);
    return score;
}

ScoreKey key(int dayOffset, ScoreKind kind = ScoreKind::Recovery)
{
    return ScoreKey{kDay.addDays(dayOffset), kind};
}

CacheConfig fastConfig(int capacity)
{
    CacheConfig config;
    config.capacity = capacity;
    config.retryBaseDelayMs = 1;
    return config;
}

} // namespace

class TestCacheStore : public QObject
{
    Q_OBJECT

private slots:
    void putThenGet()
    {
        auto durable = std::make_unique<MemoryScoreStore>();
        CacheStore cache(std::move(durable), fastConfig(10));

        const CompositeScore score = makeScore(kDay, ScoreKind::Sleep, 81);
        cache.put(keyOf(score), score);

        const auto got = cache.get(keyOf(score));
        QVERIFY(got.has_value());
        QCOMPARE(*got, score);
        QCOMPARE(cache.stats().hits, quint64(1));

        const auto entry = cache.entry(keyOf(score));
        QVERIFY(entry.has_value());
        QCOMPARE(entry->lastComputedAt, score.computedAt);
        QVERIFY(entry->lastPublishedAt.isValid());
        QVERIFY(!entry->stale);
    }

    void missCountsAndReturnsNothing()
    {
        CacheStore cache(std::make_unique<MemoryScoreStore>(), fastConfig(10));
        QVERIFY(!cache.get(key(0)).has_value());
        QCOMPARE(cache.stats().misses, quint64(1));
        QCOMPARE(cache.stats().hits, quint64(0));
    }

    void evictsLeastRecentlyUsedAndFallsBackToDurable()
    {
        auto durable = std::make_unique<MemoryScoreStore>();
        MemoryScoreStore *store = durable.get();
        CacheStore cache(std::move(durable), fastConfig(3));

        for (int i = 0; i < 3; ++i) {
            cache.put(key(-i), makeScore(kDay.addDays(-i), ScoreKind::Recovery, 50 + i));
        }
        // Touch the oldest insert so the middle one becomes least recent.
        QVERIFY(cache.get(key(0)).has_value());

        cache.put(key(-3), makeScore(kDay.addDays(-3), ScoreKind::Recovery, 53));
        QCOMPARE(cache.size(), 3);
        QCOMPARE(cache.stats().evictions, quint64(1));
        QVERIFY(!cache.entry(key(-1)).has_value());
        QVERIFY(cache.entry(key(0)).has_value());
        QVERIFY(cache.entry(key(-2)).has_value());

        cache.flush();
        QCOMPARE(store->writeCount(), 4);

        const auto evicted = cache.get(key(-1));
        QVERIFY(evicted.has_value());
        QCOMPARE(evicted->overall, 51);
        QVERIFY(store->readCount() >= 1);
        // Promoted back into memory.
        QVERIFY(cache.entry(key(-1)).has_value());
        QVERIFY(!cache.entry(key(-1))->lastPublishedAt.isValid());
    }

    void evictedBeforeDurableWriteStillReadable()
    {
        auto durable = std::make_unique<MemoryScoreStore>();
        MemoryScoreStore *store = durable.get();
        store->failWrites(-1);
        CacheConfig config = fastConfig(1);
        config.maxWriteRetries = 0;
        CacheStore cache(std::move(durable), config);

        cache.put(key(0), makeScore(kDay, ScoreKind::Recovery, 70));
        cache.put(key(-1), makeScore(kDay.addDays(-1), ScoreKind::Recovery, 60));
        cache.flush();

        QVERIFY(!cache.entry(key(0)).has_value());
        const auto value = cache.get(key(0));
        QVERIFY(value.has_value());
        QCOMPARE(value->overall, 70);
        QVERIFY(cache.contains(key(0)));
    }

    void invalidateMarksStale()
    {
        CacheStore cache(std::make_unique<MemoryScoreStore>(), fastConfig(10));
        cache.put(key(0), makeScore(kDay, ScoreKind::Recovery, 70));

        cache.invalidate(key(0));
        QVERIFY(cache.isStale(key(0)));
        QCOMPARE(cache.get(key(0))->overall, 70);

        cache.put(key(0), makeScore(kDay, ScoreKind::Recovery, 72));
        QVERIFY(!cache.isStale(key(0)));
        QCOMPARE(cache.get(key(0))->overall, 72);
    }

    void durableWritesCoalescePerKey()
    {
        auto durable = std::make_unique<MemoryScoreStore>();
        MemoryScoreStore *store = durable.get();
        CacheStore cache(std::move(durable), fastConfig(10));

        for (int i = 0; i < 50; ++i) {
            cache.put(key(0), makeScore(kDay, ScoreKind::Recovery, i));
        }
        cache.flush();

        QVERIFY(store->writeCount(key(0)) >= 1);
        QVERIFY(store->writeCount(key(0)) <= 50);
        QCOMPARE(store->readScore(key(0))->overall, 49);
        QCOMPARE(cache.pendingWriteCount(), 0);
    }

    void retriesWithBackoffThenSucceeds()
    {
        auto durable = std::make_unique<MemoryScoreStore>();
        MemoryScoreStore *store = durable.get();
        store->failWrites(3);
        CacheStore cache(std::move(durable), fastConfig(10));
        QSignalSpy failed(&cache, &CacheStore::durableWriteFailed);

        cache.put(key(0), makeScore(kDay, ScoreKind::Sleep, 64));
        cache.flush();

        QCOMPARE(store->attemptCount(), 4);
        QCOMPARE(store->writeCount(), 1);
        QCOMPARE(failed.count(), 0);
        QCOMPARE(cache.stats().durableWrites, quint64(1));
    }

    void exhaustedRetriesReportAndKeepMemoryValue()
    {
        auto durable = std::make_unique<MemoryScoreStore>();
        MemoryScoreStore *store = durable.get();
        store->failWrites(-1);
        CacheConfig config = fastConfig(10);
        config.maxWriteRetries = 2;
        CacheStore cache(std::move(durable), config);
        QSignalSpy failed(&cache, &CacheStore::durableWriteFailed);

        const CompositeScore score = makeScore(kDay, ScoreKind::Recovery, 77);
        cache.put(keyOf(score), score);
        cache.flush();

        QTRY_COMPARE(failed.count(), 1);
        QCOMPARE(failed.at(0).at(0).value<ScoreKey>(), keyOf(score));
        QCOMPARE(failed.at(0).at(1).toString(), QStringLiteral("disk unavailable"));
        QCOMPARE(store->attemptCount(), 3);
        QCOMPARE(cache.stats().durableWriteFailures, quint64(1));
        QCOMPARE(*cache.get(keyOf(score)), score);

        // Storage comes back.
        store->failWrites(0);
        cache.retryFailedWrites();
        cache.flush();
        QCOMPARE(store->writeCount(), 1);
        QCOMPARE(store->readScore(keyOf(score))->overall, 77);
    }

    void listRecentMergesTiers()
    {
        auto durable = std::make_unique<MemoryScoreStore>();
        MemoryScoreStore *store = durable.get();
        for (int i = 1; i <= 5; ++i) {
            store->writeScore(makeScore(kDay.addDays(-i), ScoreKind::Recovery, 10 + i));
        }
        store->writeScore(makeScore(kDay, ScoreKind::Sleep, 99));

        CacheStore cache(std::move(durable), fastConfig(10));
        // Newer value for an archived day, plus today.
        cache.put(key(-2), makeScore(kDay.addDays(-2), ScoreKind::Recovery, 90));
        cache.put(key(0), makeScore(kDay, ScoreKind::Recovery, 80));

        const auto all = cache.listRecent(ScoreKind::Recovery, 0, 10);
        QCOMPARE(all.size(), std::size_t(6));
        QCOMPARE(all[0].day, kDay);
        QCOMPARE(all[0].overall, 80);
        QCOMPARE(all[2].day, kDay.addDays(-2));
        QCOMPARE(all[2].overall, 90);
        for (std::size_t i = 1; i < all.size(); ++i) {
            QVERIFY(all[i - 1].day > all[i].day);
            QCOMPARE(all[i].kind, ScoreKind::Recovery);
        }

        const auto page = cache.listRecent(ScoreKind::Recovery, 2, 2);
        QCOMPARE(page.size(), std::size_t(2));
        QCOMPARE(page[0].day, kDay.addDays(-2));
        QCOMPARE(page[1].day, kDay.addDays(-3));

        QVERIFY(cache.listRecent(ScoreKind::Recovery, 0, 0).empty());
    }

    void concurrentPutsFromManyThreads()
    {
        auto durable = std::make_unique<MemoryScoreStore>();
        MemoryScoreStore *store = durable.get();
        CacheStore cache(std::move(durable), fastConfig(16));

        QList<QFuture<void>> futures;
        for (int t = 0; t < 8; ++t) {
            futures.append(QtConcurrent::run([&cache, t]() {
                for (int i = 0; i < 40; ++i) {
                    const QDate day = kDay.addDays(-(t * 40 + i));
                    cache.put(ScoreKey{day, ScoreKind::Recovery}, makeScore(day, ScoreKind::Recovery, i));
                    cache.get(ScoreKey{day, ScoreKind::Recovery});
                }
            }));
        }
        for (auto &future : futures) {
            future.waitForFinished();
        }
        cache.flush();

        QCOMPARE(cache.size(), 16);
        QCOMPARE(store->writeCount(), 320);
        QVERIFY(cache.stats().evictions >= quint64(320 - 16));
    }

    void racingPutsLeaveBothTiersAgreeing()
    {
        auto durable = std::make_unique<MemoryScoreStore>();
        MemoryScoreStore *store = durable.get();
        CacheStore cache(std::move(durable), fastConfig(4));
        const ScoreKey shared = key(0);

        for (int round = 0; round < 20; ++round) {
            QList<QFuture<void>> futures;
            for (int t = 0; t < 4; ++t) {
                futures.append(QtConcurrent::run([&cache, shared, t, round]() {
                    for (int i = 0; i < 25; ++i) {
                        cache.put(shared, makeScore(shared.day, shared.kind, round * 100 + t * 25 + i));
                    }
                }));
            }
            for (auto &future : futures) {
                future.waitForFinished();
            }
            cache.flush();

            const auto inMemory = cache.entry(shared);
            QVERIFY(inMemory.has_value());
            QCOMPARE(store->readScore(shared)->overall, inMemory->value.overall);
        }
    }
};

QTEST_GUILESS_MAIN(TestCacheStore)
#include "test_cache_store.moc"
