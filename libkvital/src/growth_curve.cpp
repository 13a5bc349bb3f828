#include "kvital/growth_curve.hpp"

#include "kvital/common.hpp"

#include <cmath>

namespace kvital {

bool isValid(const GrowthCurveConfig &config)
{
    return config.anchorScore > 0.0 && config.anchorScore < 100.0
        && config.upperRate > 0.0
        && config.lowerExponent > 0.0;
}

double growthCurveScore(double ratio, const GrowthCurveConfig &config)
{
    if (!std::isfinite(ratio) || ratio <= 0.0) {
        return 0.0;
    }

    if (ratio >= 1.0) {
        const double headroom = 100.0 - config.anchorScore;
        return clampScore(100.0 - headroom * std::exp(-config.upperRate * (ratio - 1.0)));
    }

    return clampScore(config.anchorScore * std::pow(ratio, config.lowerExponent));
}

} // namespace kvital
