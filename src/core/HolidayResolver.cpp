#include "almanac/core/HolidayResolver.hpp"

#include "almanac/core/CalendarSystem.hpp"

#include <QSet>
#include <algorithm>
#include <memory>

namespace almanac {
namespace core {

namespace {

std::optional<QDate> shiftedByDays(const CalendarSystem &calendar, const std::optional<QDate> &date, int days)
{
    if (!date) {
        return std::nullopt;
    }
    if (days == 0) {
        return date;
    }
    return calendar.dateByAdding(CalendarUnit::Day, days, *date);
}

struct RuleResolver
{
    const CalendarSystem &calendar;
    const data::HolidayDefinition &definition;
    int year;

    std::optional<QDate> operator()(const data::AnnualDate &) const
    {
        if (!definition.referenceDate.isValid()) {
            return std::nullopt;
        }
        const DateComponents parts = calendar.components(definition.referenceDate);
        return calendar.dateFromComponents(year, parts.month, parts.day);
    }

    std::optional<QDate> operator()(const data::NthWeekdayOfMonth &rule) const
    {
        return shiftedByDays(calendar, nthWeekdayOfMonth(calendar, year, rule.month, rule.weekday, rule.n), rule.dayOffset);
    }

    std::optional<QDate> operator()(const data::LastWeekdayOfMonth &rule) const
    {
        return shiftedByDays(calendar, lastWeekdayOfMonth(calendar, year, rule.month, rule.weekday), rule.dayOffset);
    }

    std::optional<QDate> operator()(const data::EasterOffset &rule) const
    {
        return shiftedByDays(calendar, easterSunday(calendar, year), rule.dayOffset);
    }
};

} // namespace

std::optional<QDate> nthWeekdayOfMonth(const CalendarSystem &calendar, int year, int month, Qt::DayOfWeek weekday, int n)
{
    if (n < 1) {
        return std::nullopt;
    }
    const auto startOfMonth = calendar.dateFromComponents(year, month, 1);
    if (!startOfMonth) {
        return std::nullopt;
    }
    const int firstWeekday = static_cast<int>(calendar.components(*startOfMonth).weekday);
    const int offset = (static_cast<int>(weekday) - firstWeekday + 7) % 7;
    const auto firstOccurrence = calendar.dateByAdding(CalendarUnit::Day, offset, *startOfMonth);
    if (!firstOccurrence) {
        return std::nullopt;
    }
    const auto nthOccurrence = calendar.dateByAdding(CalendarUnit::Day, (n - 1) * 7, *firstOccurrence);
    if (!nthOccurrence || calendar.components(*nthOccurrence).month != month) {
        return std::nullopt;
    }
    return nthOccurrence;
}

std::optional<QDate> lastWeekdayOfMonth(const CalendarSystem &calendar, int year, int month, Qt::DayOfWeek weekday)
{
    const auto startOfMonth = calendar.dateFromComponents(year, month, 1);
    if (!startOfMonth) {
        return std::nullopt;
    }
    const auto startOfNextMonth = calendar.dateByAdding(CalendarUnit::Month, 1, *startOfMonth);
    if (!startOfNextMonth) {
        return std::nullopt;
    }
    const auto endOfMonth = calendar.dateByAdding(CalendarUnit::Day, -1, *startOfNextMonth);
    if (!endOfMonth) {
        return std::nullopt;
    }
    const int endWeekday = static_cast<int>(calendar.components(*endOfMonth).weekday);
    const int offset = (endWeekday - static_cast<int>(weekday) + 7) % 7;
    return calendar.dateByAdding(CalendarUnit::Day, -offset, *endOfMonth);
}

std::optional<QDate> easterSunday(const CalendarSystem &calendar, int year)
{
    if (year < 1583) {
        return std::nullopt;
    }
    // Anonymous Gregorian algorithm (Meeus/Jones/Butcher).
    const int a = year % 19;
    const int b = year / 100;
    const int c = year % 100;
    const int d = b / 4;
    const int e = b % 4;
    const int f = (b + 8) / 25;
    const int g = (b - f + 1) / 3;
    const int h = (19 * a + b - d - g + 15) % 30;
    const int i = c / 4;
    const int k = c % 4;
    const int l = (32 + 2 * e + 2 * i - h - k) % 7;
    const int m = (a + 11 * h + 22 * l) / 451;
    const int month = (h + l - 7 * m + 114) / 31;
    const int day = ((h + l - 7 * m + 114) % 31) + 1;
    return calendar.dateFromComponents(year, month, day);
}

std::optional<QDate> dateInYear(const CalendarSystem &calendar, const data::HolidayDefinition &definition, int year)
{
    if (!definition.isRecurring) {
        if (!definition.referenceDate.isValid()) {
            return std::nullopt;
        }
        return definition.referenceDate;
    }
    return std::visit(RuleResolver{calendar, definition, year}, definition.rule);
}

std::optional<data::HolidayOccurrence> occurrenceInYear(const CalendarSystem &calendar,
                                                        const data::HolidayDefinition &definition,
                                                        int year)
{
    const auto date = dateInYear(calendar, definition, year);
    if (!date) {
        return std::nullopt;
    }
    data::HolidayOccurrence occurrence;
    occurrence.name = definition.name;
    occurrence.occurrenceDate = *date;
    occurrence.isRecurring = definition.isRecurring;
    occurrence.category = definition.category;
    occurrence.annual = definition.isRecurring && std::holds_alternative<data::AnnualDate>(definition.rule);
    occurrence.emoji = definition.emoji;
    occurrence.description = definition.description;
    return occurrence;
}

bool occursOn(const CalendarSystem &calendar, const data::HolidayOccurrence &occurrence, const QDate &queryDate)
{
    if (!occurrence.occurrenceDate.isValid() || !queryDate.isValid()) {
        return false;
    }
    if (occurrence.isRecurring && occurrence.annual) {
        const DateComponents holiday = calendar.components(occurrence.occurrenceDate);
        const DateComponents query = calendar.components(queryDate);
        return holiday.month == query.month && holiday.day == query.day;
    }
    return calendar.isSameDay(occurrence.occurrenceDate, queryDate);
}

std::vector<data::HolidayOccurrence> holidaysOn(const CalendarSystem &calendar,
                                                const HolidaySnapshot &snapshot,
                                                const QDate &queryDate)
{
    std::vector<data::HolidayOccurrence> result;
    QSet<QString> seenNames;
    for (const auto &occurrence : snapshot.occurrences) {
        if (seenNames.contains(occurrence.name) || !occursOn(calendar, occurrence, queryDate)) {
            continue;
        }
        seenNames.insert(occurrence.name);
        result.push_back(occurrence);
    }
    return result;
}

HolidaySnapshot rebuildSnapshot(const CalendarSystem &calendar,
                                const std::vector<data::HolidayDefinition> &definitions,
                                int referenceYear)
{
    HolidaySnapshot snapshot;
    snapshot.referenceYear = referenceYear;
    snapshot.occurrences.reserve(definitions.size() * 3);

    for (const auto &definition : definitions) {
        // One-off holidays resolve to the same date for every year; keep a single copy.
        const int lastYear = definition.isRecurring ? referenceYear + 1 : referenceYear - 1;
        for (int year = referenceYear - 1; year <= lastYear; ++year) {
            auto occurrence = occurrenceInYear(calendar, definition, year);
            if (occurrence) {
                snapshot.occurrences.push_back(std::move(*occurrence));
            }
        }
    }

    std::stable_sort(snapshot.occurrences.begin(), snapshot.occurrences.end(),
                     [](const data::HolidayOccurrence &lhs, const data::HolidayOccurrence &rhs) {
                         return lhs.occurrenceDate < rhs.occurrenceDate;
                     });
    return snapshot;
}

HolidayResolver::HolidayResolver(const CalendarSystem &calendar)
    : m_calendar(calendar)
    , m_snapshot(std::make_shared<const HolidaySnapshot>())
{
}

HolidayResolver::~HolidayResolver() = default;

void HolidayResolver::setDefinitions(std::vector<data::HolidayDefinition> definitions)
{
    m_definitions = std::move(definitions);
    rebuild();
}

const std::vector<data::HolidayDefinition> &HolidayResolver::definitions() const
{
    return m_definitions;
}

void HolidayResolver::setReferenceYear(int year)
{
    if (year == m_referenceYear) {
        return;
    }
    m_referenceYear = year;
    rebuild();
}

int HolidayResolver::referenceYear() const
{
    return m_referenceYear;
}

bool HolidayResolver::refreshIfNeeded(const QDate &today)
{
    if (!today.isValid()) {
        return false;
    }
    const int year = m_calendar.components(today).year;
    if (year == m_referenceYear) {
        return false;
    }
    setReferenceYear(year);
    return true;
}

std::shared_ptr<const HolidaySnapshot> HolidayResolver::snapshot() const
{
    return std::atomic_load(&m_snapshot);
}

std::vector<data::HolidayOccurrence> HolidayResolver::holidaysOn(const QDate &date) const
{
    return core::holidaysOn(m_calendar, *snapshot(), date);
}

std::vector<data::HolidayOccurrence> HolidayResolver::holidaysInMonth(int month, int year) const
{
    std::vector<data::HolidayOccurrence> result;
    const auto current = snapshot();
    for (const auto &occurrence : current->occurrences) {
        const DateComponents parts = m_calendar.components(occurrence.occurrenceDate);
        if (parts.month == month && parts.year == year) {
            result.push_back(occurrence);
        }
    }
    return result;
}

std::vector<data::HolidayOccurrence> HolidayResolver::holidaysForYear(int year) const
{
    std::vector<data::HolidayOccurrence> result;
    const auto current = snapshot();
    for (const auto &occurrence : current->occurrences) {
        if (m_calendar.components(occurrence.occurrenceDate).year == year) {
            result.push_back(occurrence);
        }
    }
    return result;
}

std::vector<data::HolidayOccurrence> HolidayResolver::upcomingHolidays(const QDate &from, std::size_t limit) const
{
    std::vector<data::HolidayOccurrence> result;
    const auto current = snapshot();
    for (const auto &occurrence : current->occurrences) {
        if (result.size() >= limit) {
            break;
        }
        if (occurrence.occurrenceDate >= from) {
            result.push_back(occurrence);
        }
    }
    return result;
}

std::map<data::HolidayCategory, std::vector<data::HolidayOccurrence>> HolidayResolver::holidaysByCategory() const
{
    std::map<data::HolidayCategory, std::vector<data::HolidayOccurrence>> grouped;
    const auto current = snapshot();
    for (const auto &occurrence : current->occurrences) {
        grouped[occurrence.category].push_back(occurrence);
    }
    return grouped;
}

void HolidayResolver::rebuild()
{
    // Year zero means no reference year has been set yet.
    auto next = m_referenceYear == 0
        ? std::make_shared<const HolidaySnapshot>()
        : std::make_shared<const HolidaySnapshot>(rebuildSnapshot(m_calendar, m_definitions, m_referenceYear));
    std::atomic_store(&m_snapshot, std::move(next));
}

} // namespace core
} // namespace almanac
