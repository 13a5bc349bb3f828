#include "kvital/sample_store.hpp"

#include "kvital/common.hpp"
#include "sql_connections.hpp"

#include <QDebug>
#include <QSqlError>
#include <QSqlQuery>
#include <QTimeZone>
#include <QVariant>

namespace kvital {

namespace {
constexpr int kSchemaVersion = 1;

QString lastErrorString(const QSqlDatabase &db)
{
    return db.lastError().text();
}

QString lastErrorString(const QSqlQuery &query)
{
    return query.lastError().text();
}

} // namespace

SampleStore::SampleStore(const QString &dbPath)
    : dbPath_(dbPath)
    , connectionPrefix_(connectionPrefixFor("samples"))
{
}

SampleStore::~SampleStore()
{
    removeThreadConnections(connectionPrefix_);
}

QSqlDatabase SampleStore::connection()
{
    return threadConnection(connectionPrefix_, dbPath_, "SampleStore");
}

bool SampleStore::open()
{
    return connection().isOpen();
}

bool SampleStore::initSchema()
{
    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        return false;
    }

    QSqlQuery query(db);

    if (!query.exec(QStringLiteral("PRAGMA journal_mode=WAL"))) {
        qWarning() << "SampleStore: failed to enable WAL:" << lastErrorString(query);
    }

    const char *createSql = R"(
        CREATE TABLE IF NOT EXISTS samples (
            kind         INTEGER NOT NULL,
            timestamp_ms INTEGER NOT NULL,
            day_key      TEXT    NOT NULL,
            value        REAL    NOT NULL,
            PRIMARY KEY (kind, timestamp_ms)
        )
    )";

    if (!query.exec(QString::fromUtf8(createSql))) {
        qWarning() << "SampleStore: failed to create samples table:"
                   << lastErrorString(query);
        return false;
    }

    if (!query.exec(QStringLiteral(
            "CREATE INDEX IF NOT EXISTS samples_by_day ON samples (kind, day_key)"))) {
        qWarning() << "SampleStore: failed to create day index:"
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
        qWarning() << "SampleStore: failed to create meta table:"
                   << lastErrorString(query);
        return false;
    }

    query.prepare(QStringLiteral(
        "INSERT OR REPLACE INTO meta (key, value) VALUES ('samples_schema_version', ?)"
    ));
    query.addBindValue(QString::number(kSchemaVersion));
    if (!query.exec()) {
        qWarning() << "SampleStore: failed to write schema version:"
                   << lastErrorString(query);
    }

    return true;
}

bool SampleStore::insertSamples(const std::vector<BiometricSample> &samples, int *outInserted)
{
    if (outInserted) {
        *outInserted = 0;
    }

    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        return false;
    }

    if (!db.transaction()) {
        qWarning() << "SampleStore: failed to begin transaction:" << lastErrorString(db);
        return false;
    }

    QSqlQuery query(db);
    query.prepare(QStringLiteral(R"(
        INSERT OR IGNORE INTO samples (kind, timestamp_ms, day_key, value)
        VALUES (?, ?, ?, ?)
    )"));

    int inserted = 0;
    for (const auto &sample : samples) {
        if (!sample.timestamp.isValid()) {
            continue;
        }

        query.addBindValue(static_cast<int>(sample.kind));
        query.addBindValue(sample.timestamp.toMSecsSinceEpoch());
        query.addBindValue(dayToString(sampleDay(sample)));
        query.addBindValue(sample.value);

        if (!query.exec()) {
            qWarning() << "SampleStore: insertSamples failed:" << lastErrorString(query);
            db.rollback();
            return false;
        }

        inserted += query.numRowsAffected() > 0 ? 1 : 0;
    }

    if (!db.commit()) {
        qWarning() << "SampleStore: commit failed:" << lastErrorString(db);
        db.rollback();
        return false;
    }

    if (outInserted) {
        *outInserted = inserted;
    }
    return true;
}

std::vector<BiometricSample> SampleStore::samplesForDays(MetricKind kind,
                                                         const QDate &firstDay,
                                                         const QDate &lastDay)
{
    std::vector<BiometricSample> results;

    QSqlDatabase db = connection();
    if (!db.isOpen()) {
        return results;
    }

    QSqlQuery query(db);
    if (!query.prepare(QStringLiteral(
            "SELECT timestamp_ms, value FROM samples "
            "WHERE kind = ? AND day_key BETWEEN ? AND ? "
            "ORDER BY timestamp_ms ASC"))) {
        qWarning() << "SampleStore: samplesForDays prepare failed:"
                   << lastErrorString(query);
        return results;
    }

    // ISO dates sort lexicographically in calendar order.
    query.addBindValue(static_cast<int>(kind));
    query.addBindValue(dayToString(firstDay));
    query.addBindValue(dayToString(lastDay));

    if (!query.exec()) {
        qWarning() << "SampleStore: samplesForDays exec failed:"
                   << lastErrorString(query);
        return results;
    }

    while (query.next()) {
        BiometricSample sample;
        sample.kind      = kind;
        sample.timestamp = QDateTime::fromMSecsSinceEpoch(query.value(0).toLongLong(),
                                                          QTimeZone::utc());
        sample.value     = query.value(1).toDouble();
        results.push_back(sample);
    }

    return results;
}

} // namespace kvital
