#pragma once

#include <optional>

#include "almanac/core/NavigationState.hpp"

namespace almanac {
namespace core {

class CalendarSystem;

// Range of days shown by a view mode for a given anchor. Empty when the calendar cannot
// produce one of the bounds.
std::optional<DateRange> visibleRange(const CalendarSystem &calendar, ViewMode mode, const QDate &anchor);

// Owns the navigation state of one calendar view. Every mutation is all-or-nothing: when a
// date computation fails the state is left exactly as it was.
class NavigationEngine
{
public:
    explicit NavigationEngine(const CalendarSystem &calendar, NavigationState state = {});

    const NavigationState &state() const;
    QDate currentAnchor() const;
    std::optional<QDate> selectedDate() const;
    ViewMode viewMode() const;
    std::optional<ViewMode> previousViewMode() const;

    void navigate(NavigationUnit unit, NavigationDirection direction);
    // Month paging, or year paging while the year view is active.
    void navigatePage(NavigationDirection direction);

    // Shifts the selection by a number of days; no-op without a selection. The anchor follows
    // only when the new selection leaves the visible window.
    void moveSelectedBy(int days);
    void selectDate(const QDate &date);
    void clearSelection();
    void goToday(const QDate &today);

    void setViewMode(ViewMode mode);
    void toggleYearView();

    bool isWithinWindow(const QDate &date) const;
    std::optional<DateRange> visibleRange() const;

private:
    std::optional<bool> withinWindow(const QDate &anchor, const QDate &date) const;
    void applySelection(const QDate &date);

    const CalendarSystem &m_calendar;
    NavigationState m_state;
    std::optional<ViewMode> m_previousViewMode;
};

} // namespace core
} // namespace almanac
