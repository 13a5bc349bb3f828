#include "kvital/common.hpp"

#include <cmath>

namespace kvital {

QDateTime nowUtc()
{
    return QDateTime::currentDateTimeUtc();
}

double clampScore(double value)
{
    if (std::isnan(value)) {
        return 0.0;
    }
    return clampValue(value, 0.0, 100.0);
}

QString dayToString(const QDate &day)
{
    return day.toString(Qt::ISODate);
}

QDate dayFromString(const QString &s)
{
    return QDate::fromString(s.trimmed(), Qt::ISODate);
}

} // namespace kvital
