#pragma once

#include <QDate>
#include <optional>

namespace almanac {
namespace core {

enum class CalendarUnit
{
    Day,
    Week,
    Month,
    Year,
};

struct DateComponents
{
    int year = 0;
    int month = 0;
    int day = 0;
    Qt::DayOfWeek weekday = Qt::Monday;
};

// Host calendar capability. Every operation that can fail returns an empty optional.
class CalendarSystem
{
public:
    virtual ~CalendarSystem() = default;

    virtual std::optional<QDate> dateFromComponents(int year, int month, int day) const = 0;
    virtual DateComponents components(const QDate &date) const = 0;
    virtual std::optional<QDate> dateByAdding(CalendarUnit unit, int value, const QDate &date) const = 0;
    virtual bool isSameDay(const QDate &lhs, const QDate &rhs) const = 0;
};

} // namespace core
} // namespace almanac
