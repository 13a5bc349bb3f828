#pragma once

#include <QDate>
#include <QDateTime>

namespace kvital {

QDateTime nowUtc();

// Local-time hour at which the night window used for sleep attribution
// starts and ends.
constexpr int NightBoundaryHour = 12;

template<typename T>
constexpr T clampValue(T value, T low, T high)
{
    return value < low ? low : (high < value ? high : value);
}

// Clamp to the 0..100 score scale. NaN collapses to 0.
double clampScore(double value);

QString dayToString(const QDate &day);
QDate dayFromString(const QString &s);

} // namespace kvital
