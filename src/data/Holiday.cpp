#include "almanac/data/Holiday.hpp"

namespace almanac {
namespace data {

const std::vector<HolidayCategory> &allHolidayCategories()
{
    static const std::vector<HolidayCategory> categories = {
        HolidayCategory::Religious, HolidayCategory::Cultural,    HolidayCategory::National,
        HolidayCategory::Seasonal,  HolidayCategory::Educational, HolidayCategory::Other,
    };
    return categories;
}

QString categoryKey(HolidayCategory category)
{
    switch (category) {
    case HolidayCategory::Religious:
        return QStringLiteral("Religious");
    case HolidayCategory::Cultural:
        return QStringLiteral("Cultural");
    case HolidayCategory::National:
        return QStringLiteral("National");
    case HolidayCategory::Seasonal:
        return QStringLiteral("Seasonal");
    case HolidayCategory::Educational:
        return QStringLiteral("Educational");
    case HolidayCategory::Other:
    default:
        return QStringLiteral("Other");
    }
}

std::optional<HolidayCategory> categoryFromKey(const QString &key)
{
    for (HolidayCategory category : allHolidayCategories()) {
        if (categoryKey(category).compare(key, Qt::CaseInsensitive) == 0) {
            return category;
        }
    }
    return std::nullopt;
}

bool operator==(const AnnualDate &, const AnnualDate &)
{
    return true;
}

bool operator==(const NthWeekdayOfMonth &lhs, const NthWeekdayOfMonth &rhs)
{
    return lhs.month == rhs.month && lhs.weekday == rhs.weekday && lhs.n == rhs.n
        && lhs.dayOffset == rhs.dayOffset;
}

bool operator==(const LastWeekdayOfMonth &lhs, const LastWeekdayOfMonth &rhs)
{
    return lhs.month == rhs.month && lhs.weekday == rhs.weekday && lhs.dayOffset == rhs.dayOffset;
}

bool operator==(const EasterOffset &lhs, const EasterOffset &rhs)
{
    return lhs.dayOffset == rhs.dayOffset;
}

} // namespace data
} // namespace almanac
