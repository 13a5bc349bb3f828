#pragma once

#include <QString>

#include "kvital/score.hpp"

namespace kvital {

// User-facing reading of the numbers. Descriptive only; nothing here feeds
// back into a score.

enum class StressBand {
    Excellent,   // 0-3% weighted deviation
    Good,        // 3-8%
    Elevated,    // 8-15%
    High         // above 15%
};

StressBand stressBand(double avgWeightedDeviationPct);
QString stressBandToString(StressBand band);

QString sleepSummary(int sleepScore);

// Training guidance for a recovery score, falling back to the weakest
// component when the overall score is low.
QString recoveryDirective(const CompositeScore &recovery);

} // namespace kvital
