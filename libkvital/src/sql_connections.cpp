#include "sql_connections.hpp"

#include <QAtomicInteger>
#include <QDebug>
#include <QMutex>
#include <QSet>
#include <QSqlError>
#include <QThreadStorage>

namespace kvital {

namespace {

QMutex connectionsMutex;
QSet<QString> openConnections;

QAtomicInteger<quint64> nextStoreId(0);
QAtomicInteger<quint64> nextThreadId(0);

void removeMatching(const QString &prefix, const QString &suffix)
{
    QMutexLocker lock(&connectionsMutex);
    for (auto it = openConnections.begin(); it != openConnections.end();) {
        if (it->startsWith(prefix) && it->endsWith(suffix)) {
            QSqlDatabase::removeDatabase(*it);
            it = openConnections.erase(it);
        } else {
            ++it;
        }
    }
}

// Identity of the current thread for connection naming. Owned by
// QThreadStorage, so it is destroyed on the thread that used it.
class ThreadTag
{
public:
    ThreadTag()
        : suffix_(QStringLiteral("_t%1").arg(nextThreadId.fetchAndAddRelaxed(1) + 1))
    {
    }

    ~ThreadTag()
    {
        removeMatching(QString(), suffix_);
    }

    const QString &suffix() const { return suffix_; }

private:
    QString suffix_;
};

QThreadStorage<ThreadTag *> threadTags;

const QString &currentThreadSuffix()
{
    if (!threadTags.hasLocalData()) {
        threadTags.setLocalData(new ThreadTag);
    }
    return threadTags.localData()->suffix();
}

} // namespace

QString connectionPrefixFor(const char *store)
{
    return QStringLiteral("kvital_%1_%2")
        .arg(QString::fromLatin1(store))
        .arg(nextStoreId.fetchAndAddRelaxed(1) + 1);
}

QSqlDatabase threadConnection(const QString &prefix, const QString &dbPath, const char *owner)
{
    const QString name = prefix + currentThreadSuffix();

    QSqlDatabase db;
    if (QSqlDatabase::contains(name)) {
        db = QSqlDatabase::database(name, false);
    } else {
        db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), name);
        db.setDatabaseName(dbPath);
        db.setConnectOptions(QStringLiteral("QSQLITE_BUSY_TIMEOUT=5000"));
        QMutexLocker lock(&connectionsMutex);
        openConnections.insert(name);
    }

    if (!db.isOpen() && !db.open()) {
        qWarning().nospace() << owner << ": failed to open database: "
                             << dbPath << " - " << db.lastError().text();
    }

    return db;
}

void removeThreadConnections(const QString &prefix)
{
    // Suffixes start with "_t", so "kvital_samples_1" never matches
    // "kvital_samples_12_t3".
    removeMatching(prefix + QStringLiteral("_t"), QString());
}

} // namespace kvital
