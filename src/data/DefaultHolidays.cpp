#include "almanac/data/DefaultHolidays.hpp"

#include <QObject>

namespace almanac {
namespace data {

namespace {
// Leap year, so that February 29 is representable.
constexpr int REFERENCE_YEAR = 2024;

HolidayDefinition annual(const QString &name, int month, int day, HolidayCategory category,
                         const QString &emoji, const QString &description)
{
    HolidayDefinition definition;
    definition.name = name;
    definition.referenceDate = QDate(REFERENCE_YEAR, month, day);
    definition.isRecurring = true;
    definition.category = category;
    definition.rule = AnnualDate{};
    definition.emoji = emoji;
    definition.description = description;
    return definition;
}

HolidayDefinition floating(const QString &name, RecurrenceRule rule, HolidayCategory category,
                           const QString &emoji, const QString &description)
{
    HolidayDefinition definition;
    definition.name = name;
    definition.isRecurring = true;
    definition.category = category;
    definition.rule = std::move(rule);
    definition.emoji = emoji;
    definition.description = description;
    return definition;
}

NthWeekdayOfMonth nth(int n, Qt::DayOfWeek weekday, int month, int dayOffset = 0)
{
    return NthWeekdayOfMonth{month, weekday, n, dayOffset};
}

LastWeekdayOfMonth last(Qt::DayOfWeek weekday, int month, int dayOffset = 0)
{
    return LastWeekdayOfMonth{month, weekday, dayOffset};
}

EasterOffset easter(int dayOffset = 0)
{
    return EasterOffset{dayOffset};
}
} // namespace

std::vector<HolidayDefinition> defaultHolidayDefinitions()
{
    using C = HolidayCategory;
    return {
        annual(QStringLiteral("New Year's Day"), 1, 1, C::National, QStringLiteral("🎉"),
               QObject::tr("The first day of the year.")),
        annual(QStringLiteral("Epiphany"), 1, 6, C::Religious, QStringLiteral("⭐"),
               QObject::tr("Commemorates the visit of the Magi.")),
        floating(QStringLiteral("Martin Luther King Jr. Day"), nth(3, Qt::Monday, 1), C::National,
                 QStringLiteral("✊"), QObject::tr("Honors the civil rights leader, third Monday of January.")),
        annual(QStringLiteral("Groundhog Day"), 2, 2, C::Cultural, QStringLiteral("🦫"),
               QObject::tr("Folk tradition predicting the arrival of spring.")),
        annual(QStringLiteral("Valentine's Day"), 2, 14, C::Cultural, QStringLiteral("❤️"),
               QObject::tr("A celebration of love and affection.")),
        floating(QStringLiteral("Presidents' Day"), nth(3, Qt::Monday, 2), C::National, QStringLiteral("🏛️"),
                 QObject::tr("Washington's Birthday, third Monday of February.")),
        annual(QStringLiteral("Leap Day"), 2, 29, C::Other, QStringLiteral("🐸"),
               QObject::tr("The extra day of a leap year.")),
        floating(QStringLiteral("Daylight Saving Time Begins"), nth(2, Qt::Sunday, 3), C::Seasonal,
                 QStringLiteral("⏰"), QObject::tr("Clocks move forward one hour.")),
        annual(QStringLiteral("Pi Day"), 3, 14, C::Educational, QStringLiteral("🥧"),
               QObject::tr("Celebrates the mathematical constant 3.14.")),
        annual(QStringLiteral("St. Patrick's Day"), 3, 17, C::Cultural, QStringLiteral("☘️"),
               QObject::tr("Irish cultural and religious celebration.")),
        annual(QStringLiteral("First Day of Spring"), 3, 20, C::Seasonal, QStringLiteral("🌸"),
               QObject::tr("The vernal equinox.")),
        floating(QStringLiteral("Mardi Gras"), easter(-47), C::Cultural, QStringLiteral("🎭"),
                 QObject::tr("Fat Tuesday, the last day before Lent.")),
        floating(QStringLiteral("Ash Wednesday"), easter(-46), C::Religious, QStringLiteral("✝️"),
                 QObject::tr("The first day of Lent.")),
        floating(QStringLiteral("Palm Sunday"), easter(-7), C::Religious, QStringLiteral("🌿"),
                 QObject::tr("The Sunday before Easter.")),
        floating(QStringLiteral("Good Friday"), easter(-2), C::Religious, QStringLiteral("✝️"),
                 QObject::tr("Commemorates the crucifixion.")),
        floating(QStringLiteral("Easter"), easter(), C::Religious, QStringLiteral("🐣"),
                 QObject::tr("Celebrates the resurrection.")),
        floating(QStringLiteral("Easter Monday"), easter(1), C::Religious, QStringLiteral("🐰"),
                 QObject::tr("The day after Easter Sunday.")),
        annual(QStringLiteral("Earth Day"), 4, 22, C::Educational, QStringLiteral("🌍"),
               QObject::tr("Support for environmental protection.")),
        floating(QStringLiteral("Arbor Day"), last(Qt::Friday, 4), C::Educational, QStringLiteral("🌳"),
                 QObject::tr("Tree planting day, last Friday of April.")),
        floating(QStringLiteral("Mother's Day"), nth(2, Qt::Sunday, 5), C::Cultural, QStringLiteral("💐"),
                 QObject::tr("Honors mothers, second Sunday of May.")),
        floating(QStringLiteral("Ascension Day"), easter(39), C::Religious, QStringLiteral("☁️"),
                 QObject::tr("Forty days after Easter.")),
        floating(QStringLiteral("Memorial Day"), last(Qt::Monday, 5), C::National, QStringLiteral("🇺🇸"),
                 QObject::tr("Honors fallen service members, last Monday of May.")),
        floating(QStringLiteral("Pentecost"), easter(49), C::Religious, QStringLiteral("🕊️"),
                 QObject::tr("Fifty days after Easter.")),
        annual(QStringLiteral("Flag Day"), 6, 14, C::National, QStringLiteral("🇺🇸"),
               QObject::tr("Commemorates the adoption of the flag.")),
        floating(QStringLiteral("Father's Day"), nth(3, Qt::Sunday, 6), C::Cultural, QStringLiteral("👔"),
                 QObject::tr("Honors fathers, third Sunday of June.")),
        annual(QStringLiteral("Juneteenth"), 6, 19, C::National, QStringLiteral("✊🏿"),
               QObject::tr("Commemorates the end of slavery in the United States.")),
        annual(QStringLiteral("First Day of Summer"), 6, 21, C::Seasonal, QStringLiteral("☀️"),
               QObject::tr("The summer solstice.")),
        annual(QStringLiteral("Independence Day"), 7, 4, C::National, QStringLiteral("🎆"),
               QObject::tr("Celebrates the Declaration of Independence.")),
        floating(QStringLiteral("Labor Day"), nth(1, Qt::Monday, 9), C::National, QStringLiteral("🛠️"),
                 QObject::tr("Honors workers, first Monday of September.")),
        floating(QStringLiteral("Grandparents Day"), nth(1, Qt::Monday, 9, 6), C::Cultural, QStringLiteral("👵"),
                 QObject::tr("The first Sunday after Labor Day.")),
        annual(QStringLiteral("Patriot Day"), 9, 11, C::National, QStringLiteral("🕯️"),
               QObject::tr("Remembers the victims of September 11, 2001.")),
        annual(QStringLiteral("Constitution Day"), 9, 17, C::Educational, QStringLiteral("📜"),
               QObject::tr("Commemorates the signing of the Constitution.")),
        annual(QStringLiteral("First Day of Autumn"), 9, 22, C::Seasonal, QStringLiteral("🍂"),
               QObject::tr("The autumnal equinox.")),
        floating(QStringLiteral("Indigenous Peoples' Day"), nth(2, Qt::Monday, 10), C::National,
                 QStringLiteral("🪶"), QObject::tr("Also observed as Columbus Day, second Monday of October.")),
        annual(QStringLiteral("Halloween"), 10, 31, C::Cultural, QStringLiteral("🎃"),
               QObject::tr("Costumes and trick-or-treating.")),
        annual(QStringLiteral("All Saints' Day"), 11, 1, C::Religious, QStringLiteral("😇"),
               QObject::tr("Honors all saints.")),
        floating(QStringLiteral("Daylight Saving Time Ends"), nth(1, Qt::Sunday, 11), C::Seasonal,
                 QStringLiteral("⏰"), QObject::tr("Clocks move back one hour.")),
        floating(QStringLiteral("Election Day"), nth(1, Qt::Monday, 11, 1), C::National, QStringLiteral("🗳️"),
                 QObject::tr("The Tuesday after the first Monday of November.")),
        annual(QStringLiteral("Veterans Day"), 11, 11, C::National, QStringLiteral("🎖️"),
               QObject::tr("Honors military veterans.")),
        floating(QStringLiteral("Thanksgiving"), nth(4, Qt::Thursday, 11), C::Cultural, QStringLiteral("🦃"),
                 QObject::tr("A harvest feast, fourth Thursday of November.")),
        floating(QStringLiteral("Black Friday"), nth(4, Qt::Thursday, 11, 1), C::Cultural, QStringLiteral("🛍️"),
                 QObject::tr("The day after Thanksgiving.")),
        floating(QStringLiteral("Cyber Monday"), nth(4, Qt::Thursday, 11, 4), C::Cultural, QStringLiteral("💻"),
                 QObject::tr("The Monday after Thanksgiving.")),
        annual(QStringLiteral("Pearl Harbor Remembrance Day"), 12, 7, C::National, QStringLiteral("⚓"),
               QObject::tr("Remembers the attack on Pearl Harbor.")),
        annual(QStringLiteral("First Day of Winter"), 12, 21, C::Seasonal, QStringLiteral("❄️"),
               QObject::tr("The winter solstice.")),
        annual(QStringLiteral("Christmas Eve"), 12, 24, C::Religious, QStringLiteral("🎄"),
               QObject::tr("The evening before Christmas Day.")),
        annual(QStringLiteral("Christmas Day"), 12, 25, C::Religious, QStringLiteral("🎅"),
               QObject::tr("Celebrates the birth of Jesus.")),
        annual(QStringLiteral("Boxing Day"), 12, 26, C::Cultural, QStringLiteral("📦"),
               QObject::tr("Traditional day of giving.")),
        annual(QStringLiteral("New Year's Eve"), 12, 31, C::Cultural, QStringLiteral("🎊"),
               QObject::tr("The last day of the year.")),
    };
}

} // namespace data
} // namespace almanac
