#pragma once

#include <QSqlDatabase>
#include <QString>

namespace kvital {

// QSqlDatabase connections may only be used from the thread that created
// them. These helpers hand out one named connection per (store, thread).
// Names never repeat: stores and threads are both numbered from counters,
// and a thread's connections are removed when it exits.

QString connectionPrefixFor(const char *store);

// Open (creating on first use) the calling thread's connection for `prefix`.
// The returned handle may be closed if opening failed; `owner` prefixes the
// warning.
QSqlDatabase threadConnection(const QString &prefix, const QString &dbPath, const char *owner);

// Remove every connection created under `prefix`.
void removeThreadConnections(const QString &prefix);

} // namespace kvital
