#include "kvital/score_archive.hpp"

#include "kvital/common.hpp"
#include "sql_connections.hpp"

#include <QDebug>
#include <QJsonDocument>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>

#include <algorithm>

namespace kvital {

namespace {
constexpr int kSchemaVersion = 1;

QString lastErrorString(const QSqlQuery &query)
{
    return query.lastError().text();
}

std::optional<CompositeScore> scoreFromRow(const QSqlQuery &query, int payloadColumn)
{
    const QString payload = query.value(payloadColumn).toString();
    auto score = scoreFromJsonString(payload);
    if (!score) {
        qWarning() << "ScoreArchive: discarding unreadable payload for"
                   << query.value(0).toString();
    }
    return score;
}

} // namespace

ScoreArchive::ScoreArchive(const QString &dbPath)
    : dbPath_(dbPath)
    , connectionPrefix_(connectionPrefixFor("scores"))
{
}

ScoreArchive::~ScoreArchive()
{
    removeThreadConnections(connectionPrefix_);
}

QSqlDatabase ScoreArchive::connection()
{
    return threadConnection(connectionPrefix_, dbPath_, "ScoreArchive");
}

bool ScoreArchive::open()
{
    return connection().isOpen();
}

bool ScoreArchive::initSchema()
{
    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        return false;
    }

    QSqlQuery query(db);

    if (!query.exec(QStringLiteral("PRAGMA journal_mode=WAL"))) {
        qWarning() << "ScoreArchive: failed to enable WAL:" << lastErrorString(query);
    }

    const char *createSql = R"(
        CREATE TABLE IF NOT EXISTS scores (
            day_key        TEXT    NOT NULL,
            kind           INTEGER NOT NULL,
            overall        INTEGER NOT NULL,
            data_complete  INTEGER NOT NULL,
            computed_at_ms INTEGER,
            payload        TEXT    NOT NULL,
            PRIMARY KEY (day_key, kind)
        )
    )";

    if (!query.exec(QString::fromUtf8(createSql))) {
        qWarning() << "ScoreArchive: failed to create scores table:"
                   << lastErrorString(query);
        return false;
    }

    const char *metaSql = R"(
        CREATE TABLE IF NOT EXISTS meta (
            key   TEXT PRIMARY KEY,
            value TEXT NOT NULL
        )
    )";

    if (!query.exec(QString::fromUtf8(metaSql))) {
        qWarning() << "ScoreArchive: failed to create meta table:"
                   << lastErrorString(query);
        return false;
    }

    query.prepare(QStringLiteral(
        "INSERT OR REPLACE INTO meta (key, value) VALUES ('scores_schema_version', ?)"
    ));
    query.addBindValue(QString::number(kSchemaVersion));
    if (!query.exec()) {
        qWarning() << "ScoreArchive: failed to write schema version:"
                   << lastErrorString(query);
    }

    return true;
}

bool ScoreArchive::writeScore(const CompositeScore &score, QString *error)
{
    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        if (error) {
            *error = db.lastError().text();
        }
        return false;
    }

    QSqlQuery query(db);
    query.prepare(QStringLiteral(R"(
        INSERT OR REPLACE INTO scores (
            day_key,
            kind,
            overall,
            data_complete,
            computed_at_ms,
            payload
        ) VALUES (?, ?, ?, ?, ?, ?)
    )"));

    query.addBindValue(dayToString(score.day));
    query.addBindValue(static_cast<int>(score.kind));
    query.addBindValue(score.overall);
    query.addBindValue(score.dataComplete ? 1 : 0);
    if (score.computedAt.isValid()) {
        query.addBindValue(score.computedAt.toMSecsSinceEpoch());
    } else {
        query.addBindValue(QVariant());  // NULL
    }
    query.addBindValue(scoreToJsonString(score));

    if (!query.exec()) {
        if (error) {
            *error = lastErrorString(query);
        }
        return false;
    }

    return true;
}

std::optional<CompositeScore> ScoreArchive::readScore(const ScoreKey &key)
{
    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        return std::nullopt;
    }

    QSqlQuery query(db);
    query.prepare(QStringLiteral(
        "SELECT day_key, payload FROM scores WHERE day_key = ? AND kind = ?"
    ));
    query.addBindValue(dayToString(key.day));
    query.addBindValue(static_cast<int>(key.kind));

    if (!query.exec()) {
        qWarning() << "ScoreArchive: readScore failed:" << lastErrorString(query);
        return std::nullopt;
    }

    if (!query.next()) {
        return std::nullopt;
    }

    return scoreFromRow(query, 1);
}

std::vector<CompositeScore> ScoreArchive::listRecent(ScoreKind kind, int offset, int limit)
{
    std::vector<CompositeScore> results;

    if (limit <= 0) {
        return results;
    }

    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        return results;
    }

    QSqlQuery query(db);
    if (!query.prepare(QStringLiteral(
            "SELECT day_key, payload FROM scores WHERE kind = ? "
            "ORDER BY day_key DESC LIMIT ? OFFSET ?"))) {
        qWarning() << "ScoreArchive: listRecent prepare failed:"
                   << lastErrorString(query);
        return results;
    }

    query.addBindValue(static_cast<int>(kind));
    query.addBindValue(limit);
    query.addBindValue(std::max(0, offset));

    if (!query.exec()) {
        qWarning() << "ScoreArchive: listRecent exec failed:"
                   << lastErrorString(query);
        return results;
    }

    while (query.next()) {
        if (auto score = scoreFromRow(query, 1)) {
            results.push_back(std::move(*score));
        }
    }

    return results;
}

} // namespace kvital
