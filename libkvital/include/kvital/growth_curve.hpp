#pragma once

namespace kvital {

// Shape of the baseline-ratio curve used for HRV and resting heart rate.
// ratio == 1 maps to anchorScore; above 1 the score approaches 100
// exponentially, below 1 it falls off as a power of the ratio.
struct GrowthCurveConfig
{
    double anchorScore = 75.0;
    double upperRate = 6.0;
    double lowerExponent = 2.5;
};

bool isValid(const GrowthCurveConfig &config);

// Monotonic non-decreasing in `ratio`, clamped to [0, 100]. Non-positive
// and non-finite ratios score 0.
double growthCurveScore(double ratio, const GrowthCurveConfig &config);

} // namespace kvital
