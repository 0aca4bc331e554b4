#pragma once

#include <QDate>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "almanac/data/Holiday.hpp"

namespace almanac {
namespace core {

class CalendarSystem;

// Occurrences of every definition for referenceYear - 1 .. referenceYear + 1, sorted by date.
struct HolidaySnapshot
{
    int referenceYear = 0;
    std::vector<data::HolidayOccurrence> occurrences;
};

std::optional<QDate> nthWeekdayOfMonth(const CalendarSystem &calendar, int year, int month, Qt::DayOfWeek weekday, int n);
std::optional<QDate> lastWeekdayOfMonth(const CalendarSystem &calendar, int year, int month, Qt::DayOfWeek weekday);
std::optional<QDate> easterSunday(const CalendarSystem &calendar, int year);

std::optional<QDate> dateInYear(const CalendarSystem &calendar, const data::HolidayDefinition &definition, int year);
std::optional<data::HolidayOccurrence> occurrenceInYear(const CalendarSystem &calendar,
                                                        const data::HolidayDefinition &definition,
                                                        int year);

bool occursOn(const CalendarSystem &calendar, const data::HolidayOccurrence &occurrence, const QDate &queryDate);

// Matching occurrences in snapshot order, at most one per name.
std::vector<data::HolidayOccurrence> holidaysOn(const CalendarSystem &calendar,
                                                const HolidaySnapshot &snapshot,
                                                const QDate &queryDate);

HolidaySnapshot rebuildSnapshot(const CalendarSystem &calendar,
                                const std::vector<data::HolidayDefinition> &definitions,
                                int referenceYear);

// Holds the definitions and publishes the current snapshot. A rebuild replaces the snapshot
// in one atomic swap; readers keep whatever snapshot they already loaded.
class HolidayResolver
{
public:
    explicit HolidayResolver(const CalendarSystem &calendar);
    ~HolidayResolver();

    void setDefinitions(std::vector<data::HolidayDefinition> definitions);
    const std::vector<data::HolidayDefinition> &definitions() const;

    // Rebuilds only when the year differs from the current reference year.
    void setReferenceYear(int year);
    int referenceYear() const;
    // Switches to the year of today when needed; returns true if the snapshot was rebuilt.
    bool refreshIfNeeded(const QDate &today);

    std::shared_ptr<const HolidaySnapshot> snapshot() const;

    std::vector<data::HolidayOccurrence> holidaysOn(const QDate &date) const;
    std::vector<data::HolidayOccurrence> holidaysInMonth(int month, int year) const;
    std::vector<data::HolidayOccurrence> holidaysForYear(int year) const;
    std::vector<data::HolidayOccurrence> upcomingHolidays(const QDate &from, std::size_t limit = 10) const;
    std::map<data::HolidayCategory, std::vector<data::HolidayOccurrence>> holidaysByCategory() const;

private:
    void rebuild();

    const CalendarSystem &m_calendar;
    std::vector<data::HolidayDefinition> m_definitions;
    int m_referenceYear = 0;
    std::shared_ptr<const HolidaySnapshot> m_snapshot;
};

} // namespace core
} // namespace almanac
