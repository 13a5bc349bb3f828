#pragma once

#include <QSqlDatabase>
#include <QString>
#include <optional>
#include <vector>

#include "kvital/score.hpp"

namespace kvital {

// Durable tier behind the cache store. Writes are issued from the cache
// store's writer thread; reads may come from any thread.
class DurableScoreStore
{
public:
    virtual ~DurableScoreStore() = default;

    // Insert or replace the score for its (day, kind). On failure returns
    // false and fills `error` when given.
    virtual bool writeScore(const CompositeScore &score, QString *error = nullptr) = 0;

    virtual std::optional<CompositeScore> readScore(const ScoreKey &key) = 0;

    // Most recent day first.
    virtual std::vector<CompositeScore> listRecent(ScoreKind kind, int offset, int limit) = 0;
};

// SQLite implementation, one connection per calling thread.
class ScoreArchive : public DurableScoreStore
{
public:
    explicit ScoreArchive(const QString &dbPath);
    ~ScoreArchive() override;

    bool open();
    bool initSchema();

    bool writeScore(const CompositeScore &score, QString *error = nullptr) override;
    std::optional<CompositeScore> readScore(const ScoreKey &key) override;
    std::vector<CompositeScore> listRecent(ScoreKind kind, int offset, int limit) override;

private:
    QString dbPath_;
    QString connectionPrefix_;

    QSqlDatabase connection();
};

} // namespace kvital
