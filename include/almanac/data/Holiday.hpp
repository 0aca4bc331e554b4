#pragma once

#include <QDate>
#include <QString>
#include <optional>
#include <variant>
#include <vector>

namespace almanac {
namespace data {

enum class HolidayCategory
{
    Religious,
    Cultural,
    National,
    Seasonal,
    Educational,
    Other,
};

const std::vector<HolidayCategory> &allHolidayCategories();
QString categoryKey(HolidayCategory category);
std::optional<HolidayCategory> categoryFromKey(const QString &key);

// Same month and day every year, taken from the definition's reference date.
struct AnnualDate
{
};

struct NthWeekdayOfMonth
{
    int month = 1;
    Qt::DayOfWeek weekday = Qt::Monday;
    int n = 1;
    int dayOffset = 0;
};

struct LastWeekdayOfMonth
{
    int month = 1;
    Qt::DayOfWeek weekday = Qt::Monday;
    int dayOffset = 0;
};

// Days relative to Western Easter Sunday.
struct EasterOffset
{
    int dayOffset = 0;
};

using RecurrenceRule = std::variant<AnnualDate, NthWeekdayOfMonth, LastWeekdayOfMonth, EasterOffset>;

bool operator==(const AnnualDate &lhs, const AnnualDate &rhs);
bool operator==(const NthWeekdayOfMonth &lhs, const NthWeekdayOfMonth &rhs);
bool operator==(const LastWeekdayOfMonth &lhs, const LastWeekdayOfMonth &rhs);
bool operator==(const EasterOffset &lhs, const EasterOffset &rhs);

struct HolidayDefinition
{
    QString name;
    QDate referenceDate;
    bool isRecurring = true;
    HolidayCategory category = HolidayCategory::Other;
    RecurrenceRule rule = AnnualDate{};
    QString emoji;
    QString description;
};

struct HolidayOccurrence
{
    QString name;
    QDate occurrenceDate;
    bool isRecurring = true;
    HolidayCategory category = HolidayCategory::Other;
    bool annual = false; // matched on month and day only
    QString emoji;
    QString description;
};

} // namespace data
} // namespace almanac
