#include "kvital/interpretation.hpp"

#include "kvital/scoring_engine.hpp"

namespace kvital {

StressBand stressBand(double avgWeightedDeviationPct)
{
    if (avgWeightedDeviationPct <= 3.0)
        return StressBand::Excellent;
    if (avgWeightedDeviationPct <= 8.0)
        return StressBand::Good;
    if (avgWeightedDeviationPct <= 15.0)
        return StressBand::Elevated;
    return StressBand::High;
}

QString stressBandToString(StressBand band)
{
    switch (band) {
    case StressBand::Excellent:
        return QStringLiteral("Excellent");
    case StressBand::Good:
        return QStringLiteral("Good");
    case StressBand::Elevated:
        return QStringLiteral("Elevated");
    case StressBand::High:
        return QStringLiteral("High");
    }

    return QStringLiteral("High");
}

QString sleepSummary(int sleepScore)
{
    if (sleepScore >= 85) {
        return QStringLiteral("Excellent sleep quality. Your body is well-rested.");
    }
    if (sleepScore >= 70) {
        return QStringLiteral("Good sleep quality. Keep your current sleep habits.");
    }
    if (sleepScore >= 50) {
        return QStringLiteral("Fair sleep quality. Consider improving your sleep routine.");
    }
    return QStringLiteral("Poor sleep quality. Focus on sleep hygiene and a steadier schedule.");
}

QString recoveryDirective(const CompositeScore &recovery)
{
    if (recovery.overall >= 85) {
        return QStringLiteral("Primed for peak performance. Ready for high-intensity training.");
    }
    if (recovery.overall >= 70) {
        return QStringLiteral("Good recovery. Moderate to high-intensity training is appropriate.");
    }
    if (recovery.overall >= 55) {
        return QStringLiteral("Moderate recovery. Consider lighter training or active recovery.");
    }

    auto below = [&recovery](const char *name, double threshold) {
        const ScoreComponent *c = recovery.component(QString::fromLatin1(name));
        return c && c->complete && c->normalizedValue < threshold;
    };

    if (below(component::Hrv, 60)) {
        return QStringLiteral("Nervous system under strain. Prioritize rest.");
    }
    if (below(component::RestingHeartRate, 60)) {
        return QStringLiteral("Elevated cardiovascular load. Focus on active recovery.");
    }
    if (below(component::SleepQuality, 50)) {
        return QStringLiteral("Poor sleep quality detected. Prioritize sleep.");
    }
    if (below(component::Stress, 70)) {
        return QStringLiteral("Stress indicators present. Consider reducing training load.");
    }
    return QStringLiteral("Recovery needs attention. Focus on rest, nutrition and stress management.");
}

} // namespace kvital
