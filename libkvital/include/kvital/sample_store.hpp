#pragma once

#include "kvital/sample.hpp"
#include "kvital/sample_source.hpp"

#include <QSqlDatabase>
#include <vector>

namespace kvital {

// SQLite-backed sample history. Each thread that touches the store gets its
// own connection to the same database file.
class SampleStore : public SampleSource
{
public:
    explicit SampleStore(const QString &dbPath);
    ~SampleStore() override;

    bool open();
    bool initSchema();

    // Inserts the batch in one transaction. Samples already present
    // (same kind and timestamp) are ignored. `outInserted` receives the
    // number of new rows.
    bool insertSamples(const std::vector<BiometricSample> &samples, int *outInserted = nullptr);

    std::vector<BiometricSample> samplesForDays(MetricKind kind,
                                                const QDate &firstDay,
                                                const QDate &lastDay) override;

private:
    QString dbPath_;
    QString connectionPrefix_;

    QSqlDatabase connection();
};

} // namespace kvital
