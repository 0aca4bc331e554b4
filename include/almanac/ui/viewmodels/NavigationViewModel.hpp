#pragma once

#include <QDate>
#include <QObject>
#include <optional>

#include "almanac/core/NavigationEngine.hpp"

namespace almanac {
namespace core {
class CalendarSystem;
}

namespace ui {

class NavigationViewModel : public QObject
{
    Q_OBJECT

public:
    explicit NavigationViewModel(const core::CalendarSystem &calendar, QObject *parent = nullptr);
    NavigationViewModel(const core::CalendarSystem &calendar, core::NavigationState state, QObject *parent = nullptr);

    const core::NavigationState &state() const;
    std::optional<core::DateRange> visibleRange() const;
    std::optional<core::ViewMode> previousViewMode() const;

    void saveState() const;
    void restoreState();

public slots:
    void navigate(core::NavigationUnit unit, core::NavigationDirection direction);
    void navigateToNextPage();
    void navigateToPreviousPage();
    void moveUpOneWeek();
    void moveDownOneWeek();
    void moveLeftOneDay();
    void moveRightOneDay();
    void selectDate(const QDate &date);
    void clearSelection();
    void goToday();
    void setViewMode(core::ViewMode mode);
    void toggleYearView();

signals:
    void stateChanged();
    void viewModeChanged(almanac::core::ViewMode mode);
    void visibleRangeChanged(const QDate &start, const QDate &end);

private:
    template <typename Mutation>
    void mutate(Mutation &&mutation);

    core::NavigationEngine m_engine;
};

} // namespace ui
} // namespace almanac
