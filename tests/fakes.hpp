#pragma once

#include <QDateTime>
#include <QHash>
#include <QMutex>
#include <QWaitCondition>

#include <algorithm>
#include <map>

#include "kvital/sample_source.hpp"
#include "kvital/score_archive.hpp"

namespace kvital::testing {

inline QDateTime localTime(const QDate &day, int hour, int minute = 0)
{
    return QDateTime(day, QTime(hour, minute));
}

inline BiometricSample makeSample(MetricKind kind, const QDateTime &timestamp, double value)
{
    BiometricSample sample;
    sample.kind = kind;
    sample.timestamp = timestamp;
    sample.value = value;
    return sample;
}

// In-memory sample history. pause() makes readers block after they have
// taken their snapshot, which lets a test hold a computation in flight.
// pauseWindowReads() blocks only multi-day reads, the ones baselines make.
class MemorySampleSource : public SampleSource
{
public:
    void add(const BiometricSample &sample)
    {
        QMutexLocker lock(&mutex_);
        samples_[{sample.kind, sample.timestamp.toMSecsSinceEpoch()}] = sample;
    }

    void add(const std::vector<BiometricSample> &samples)
    {
        for (const auto &sample : samples) {
            add(sample);
        }
    }

    std::vector<BiometricSample> samplesForDays(MetricKind kind,
                                                const QDate &firstDay,
                                                const QDate &lastDay) override
    {
        QMutexLocker lock(&mutex_);
        ++calls_;

        std::vector<BiometricSample> result;
        for (const auto &[key, sample] : samples_) {
            if (key.first != kind) {
                continue;
            }
            const QDate day = sampleDay(sample);
            if (day >= firstDay && day <= lastDay) {
                result.push_back(sample);
            }
        }

        while (paused_ || (pausedWindows_ && firstDay != lastDay)) {
            ++blocked_;
            resumed_.wait(&mutex_);
            --blocked_;
        }
        return result;
    }

    void pause()
    {
        QMutexLocker lock(&mutex_);
        paused_ = true;
    }

    void pauseWindowReads()
    {
        QMutexLocker lock(&mutex_);
        pausedWindows_ = true;
    }

    void resume()
    {
        QMutexLocker lock(&mutex_);
        paused_ = false;
        pausedWindows_ = false;
        resumed_.wakeAll();
    }

    int blockedReaders() const
    {
        QMutexLocker lock(&mutex_);
        return blocked_;
    }

    int callCount() const
    {
        QMutexLocker lock(&mutex_);
        return calls_;
    }

private:
    mutable QMutex mutex_;
    QWaitCondition resumed_;
    std::map<std::pair<MetricKind, qint64>, BiometricSample> samples_;
    bool paused_ = false;
    bool pausedWindows_ = false;
    int blocked_ = 0;
    int calls_ = 0;
};

// In-memory durable tier with failure injection.
class MemoryScoreStore : public DurableScoreStore
{
public:
    bool writeScore(const CompositeScore &score, QString *error = nullptr) override
    {
        QMutexLocker lock(&mutex_);
        ++attempts_;
        if (failuresLeft_ != 0) {
            if (failuresLeft_ > 0) {
                --failuresLeft_;
            }
            if (error) {
                *error = QStringLiteral("disk unavailable");
            }
            return false;
        }
        scores_[keyOf(score)] = score;
        ++writes_;
        writesPerKey_[keyOf(score)]++;
        return true;
    }

    std::optional<CompositeScore> readScore(const ScoreKey &key) override
    {
        QMutexLocker lock(&mutex_);
        ++reads_;
        auto it = scores_.find(key);
        if (it == scores_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<CompositeScore> listRecent(ScoreKind kind, int offset, int limit) override
    {
        QMutexLocker lock(&mutex_);
        std::vector<CompositeScore> all;
        for (auto it = scores_.rbegin(); it != scores_.rend(); ++it) {
            if (it->first.kind == kind) {
                all.push_back(it->second);
            }
        }
        std::vector<CompositeScore> page;
        for (int i = std::max(0, offset); i < static_cast<int>(all.size()) && static_cast<int>(page.size()) < limit; ++i) {
            page.push_back(all[i]);
        }
        return page;
    }

    // Fail the next `count` writes; -1 fails every write.
    void failWrites(int count)
    {
        QMutexLocker lock(&mutex_);
        failuresLeft_ = count;
    }

    int writeCount() const
    {
        QMutexLocker lock(&mutex_);
        return writes_;
    }

    int writeCount(const ScoreKey &key) const
    {
        QMutexLocker lock(&mutex_);
        return writesPerKey_.value(key);
    }

    int attemptCount() const
    {
        QMutexLocker lock(&mutex_);
        return attempts_;
    }

    int readCount() const
    {
        QMutexLocker lock(&mutex_);
        return reads_;
    }

private:
    mutable QMutex mutex_;
    std::map<ScoreKey, CompositeScore> scores_;
    QHash<ScoreKey, int> writesPerKey_;
    int failuresLeft_ = 0;
    int attempts_ = 0;
    int writes_ = 0;
    int reads_ = 0;
};

} // namespace kvital::testing
