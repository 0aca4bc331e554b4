#include "almanac/core/NavigationEngine.hpp"

#include "almanac/core/CalendarSystem.hpp"

namespace almanac {
namespace core {

namespace {

CalendarUnit calendarUnitFor(NavigationUnit unit)
{
    switch (unit) {
    case NavigationUnit::Day:
        return CalendarUnit::Day;
    case NavigationUnit::Week:
        return CalendarUnit::Week;
    case NavigationUnit::Month:
        return CalendarUnit::Month;
    case NavigationUnit::Year:
        return CalendarUnit::Year;
    }
    return CalendarUnit::Day;
}

std::optional<QDate> alignToWeekStart(const CalendarSystem &calendar, const QDate &date)
{
    const int offset = static_cast<int>(calendar.components(date).weekday) - Qt::Monday;
    return calendar.dateByAdding(CalendarUnit::Day, -offset, date);
}

} // namespace

std::optional<DateRange> visibleRange(const CalendarSystem &calendar, ViewMode mode, const QDate &anchor)
{
    if (!anchor.isValid()) {
        return std::nullopt;
    }

    if (isDayRangeMode(mode)) {
        const auto end = calendar.dateByAdding(CalendarUnit::Day, dayCount(mode) - 1, anchor);
        if (!end) {
            return std::nullopt;
        }
        return DateRange{anchor, *end};
    }

    if (mode == ViewMode::TwoWeeks) {
        const auto start = alignToWeekStart(calendar, anchor);
        if (!start) {
            return std::nullopt;
        }
        const auto end = calendar.dateByAdding(CalendarUnit::Day, 13, *start);
        if (!end) {
            return std::nullopt;
        }
        return DateRange{*start, *end};
    }

    const DateComponents parts = calendar.components(anchor);
    if (mode == ViewMode::Month) {
        const auto start = calendar.dateFromComponents(parts.year, parts.month, 1);
        if (!start) {
            return std::nullopt;
        }
        const auto nextMonth = calendar.dateByAdding(CalendarUnit::Month, 1, *start);
        if (!nextMonth) {
            return std::nullopt;
        }
        const auto end = calendar.dateByAdding(CalendarUnit::Day, -1, *nextMonth);
        if (!end) {
            return std::nullopt;
        }
        return DateRange{*start, *end};
    }

    const auto start = calendar.dateFromComponents(parts.year, 1, 1);
    const auto end = calendar.dateFromComponents(parts.year, 12, 31);
    if (!start || !end) {
        return std::nullopt;
    }
    return DateRange{*start, *end};
}

NavigationEngine::NavigationEngine(const CalendarSystem &calendar, NavigationState state)
    : m_calendar(calendar)
    , m_state(std::move(state))
{
}

const NavigationState &NavigationEngine::state() const
{
    return m_state;
}

QDate NavigationEngine::currentAnchor() const
{
    return m_state.currentAnchor;
}

std::optional<QDate> NavigationEngine::selectedDate() const
{
    return m_state.selectedDate;
}

ViewMode NavigationEngine::viewMode() const
{
    return m_state.viewMode;
}

std::optional<ViewMode> NavigationEngine::previousViewMode() const
{
    return m_previousViewMode;
}

void NavigationEngine::navigate(NavigationUnit unit, NavigationDirection direction)
{
    const int multiplier = direction == NavigationDirection::Forward ? 1 : -1;
    const auto newAnchor = m_calendar.dateByAdding(calendarUnitFor(unit), multiplier, m_state.currentAnchor);
    if (!newAnchor) {
        return;
    }
    m_state.currentAnchor = *newAnchor;
}

void NavigationEngine::navigatePage(NavigationDirection direction)
{
    navigate(m_state.viewMode == ViewMode::Year ? NavigationUnit::Year : NavigationUnit::Month, direction);
}

void NavigationEngine::moveSelectedBy(int days)
{
    if (!m_state.selectedDate) {
        return;
    }
    const auto newSelection = m_calendar.dateByAdding(CalendarUnit::Day, days, *m_state.selectedDate);
    if (!newSelection) {
        return;
    }
    applySelection(*newSelection);
}

void NavigationEngine::selectDate(const QDate &date)
{
    if (!date.isValid()) {
        return;
    }
    applySelection(date);
}

void NavigationEngine::clearSelection()
{
    m_state.selectedDate.reset();
}

void NavigationEngine::goToday(const QDate &today)
{
    if (!today.isValid()) {
        return;
    }
    m_state.currentAnchor = today;
    m_state.selectedDate = today;
}

void NavigationEngine::setViewMode(ViewMode mode)
{
    if (mode == m_state.viewMode) {
        return;
    }
    if (mode != ViewMode::Year) {
        m_previousViewMode = m_state.viewMode;
    }
    m_state.viewMode = mode;
}

void NavigationEngine::toggleYearView()
{
    if (m_state.viewMode == ViewMode::Year) {
        m_state.viewMode = m_previousViewMode.value_or(ViewMode::Month);
        m_previousViewMode.reset();
    } else {
        m_previousViewMode = m_state.viewMode;
        m_state.viewMode = ViewMode::Year;
    }
}

bool NavigationEngine::isWithinWindow(const QDate &date) const
{
    return withinWindow(m_state.currentAnchor, date).value_or(false);
}

std::optional<DateRange> NavigationEngine::visibleRange() const
{
    return core::visibleRange(m_calendar, m_state.viewMode, m_state.currentAnchor);
}

std::optional<bool> NavigationEngine::withinWindow(const QDate &anchor, const QDate &date) const
{
    if (m_state.viewMode == ViewMode::Month || m_state.viewMode == ViewMode::Year) {
        const auto range = core::visibleRange(m_calendar, m_state.viewMode, anchor);
        if (!range) {
            return std::nullopt;
        }
        return date >= range->start && date <= range->end;
    }

    const int radius = halfWindowRadius(m_state.viewMode);
    const auto lower = m_calendar.dateByAdding(CalendarUnit::Day, -radius, anchor);
    const auto upper = m_calendar.dateByAdding(CalendarUnit::Day, radius, anchor);
    if (!lower || !upper) {
        return std::nullopt;
    }
    return date >= *lower && date <= *upper;
}

void NavigationEngine::applySelection(const QDate &date)
{
    if (!m_state.currentAnchor.isValid()) {
        m_state.selectedDate = date;
        m_state.currentAnchor = date;
        return;
    }
    const auto inside = withinWindow(m_state.currentAnchor, date);
    if (!inside) {
        return;
    }
    m_state.selectedDate = date;
    if (!*inside) {
        m_state.currentAnchor = date;
    }
}

} // namespace core
} // namespace almanac
