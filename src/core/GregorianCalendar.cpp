#include "almanac/core/GregorianCalendar.hpp"

namespace almanac {
namespace core {

GregorianCalendar::GregorianCalendar() = default;
GregorianCalendar::~GregorianCalendar() = default;

std::optional<QDate> GregorianCalendar::dateFromComponents(int year, int month, int day) const
{
    if (!QDate::isValid(year, month, day)) {
        return std::nullopt;
    }
    return QDate(year, month, day);
}

DateComponents GregorianCalendar::components(const QDate &date) const
{
    DateComponents result;
    if (!date.isValid()) {
        return result;
    }
    int year = 0;
    int month = 0;
    int day = 0;
    date.getDate(&year, &month, &day);
    result.year = year;
    result.month = month;
    result.day = day;
    result.weekday = static_cast<Qt::DayOfWeek>(date.dayOfWeek());
    return result;
}

std::optional<QDate> GregorianCalendar::dateByAdding(CalendarUnit unit, int value, const QDate &date) const
{
    if (!date.isValid()) {
        return std::nullopt;
    }

    QDate shifted;
    switch (unit) {
    case CalendarUnit::Day:
        shifted = date.addDays(value);
        break;
    case CalendarUnit::Week:
        shifted = date.addDays(static_cast<qint64>(value) * 7);
        break;
    case CalendarUnit::Month:
        // QDate clamps the day to the length of the target month.
        shifted = date.addMonths(value);
        break;
    case CalendarUnit::Year:
        shifted = date.addYears(value);
        break;
    }

    if (!shifted.isValid()) {
        return std::nullopt;
    }
    return shifted;
}

bool GregorianCalendar::isSameDay(const QDate &lhs, const QDate &rhs) const
{
    return lhs.isValid() && rhs.isValid() && lhs == rhs;
}

} // namespace core
} // namespace almanac
