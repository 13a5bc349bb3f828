#pragma once

#include <QDate>
#include <vector>

#include "kvital/sample.hpp"

namespace kvital {

// Read side of the raw sample history. Implementations must be safe to call
// from several worker threads at once.
class SampleSource
{
public:
    virtual ~SampleSource() = default;

    // All samples of `kind` whose sampleDay() lies in [firstDay, lastDay],
    // ordered by timestamp.
    virtual std::vector<BiometricSample> samplesForDays(MetricKind kind,
                                                        const QDate &firstDay,
                                                        const QDate &lastDay) = 0;
};

} // namespace kvital
