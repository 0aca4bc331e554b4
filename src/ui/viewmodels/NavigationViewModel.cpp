#include "almanac/ui/viewmodels/NavigationViewModel.hpp"

#include "almanac/core/Logging.hpp"

#include <QSettings>

namespace almanac {
namespace ui {

namespace {
const auto VIEW_MODE_KEY = QStringLiteral("navigation/viewMode");

bool sameState(const core::NavigationState &lhs, const core::NavigationState &rhs)
{
    return lhs.currentAnchor == rhs.currentAnchor && lhs.selectedDate == rhs.selectedDate
        && lhs.viewMode == rhs.viewMode;
}
} // namespace

NavigationViewModel::NavigationViewModel(const core::CalendarSystem &calendar, QObject *parent)
    : NavigationViewModel(calendar, core::NavigationState{QDate::currentDate(), std::nullopt, core::ViewMode::ThreeDays}, parent)
{
}

NavigationViewModel::NavigationViewModel(const core::CalendarSystem &calendar, core::NavigationState state, QObject *parent)
    : QObject(parent)
    , m_engine(calendar, std::move(state))
{
    qRegisterMetaType<almanac::core::ViewMode>();
}

template <typename Mutation>
void NavigationViewModel::mutate(Mutation &&mutation)
{
    const core::NavigationState before = m_engine.state();
    const auto rangeBefore = m_engine.visibleRange();
    mutation();
    const core::NavigationState &after = m_engine.state();
    if (sameState(before, after)) {
        return;
    }

    qCDebug(lcUi) << "Navigation" << after.currentAnchor << core::viewModeKey(after.viewMode);
    emit stateChanged();
    if (before.viewMode != after.viewMode) {
        emit viewModeChanged(after.viewMode);
    }
    const auto rangeAfter = m_engine.visibleRange();
    if (rangeAfter && (!rangeBefore || *rangeBefore != *rangeAfter)) {
        emit visibleRangeChanged(rangeAfter->start, rangeAfter->end);
    }
}

const core::NavigationState &NavigationViewModel::state() const
{
    return m_engine.state();
}

std::optional<core::DateRange> NavigationViewModel::visibleRange() const
{
    return m_engine.visibleRange();
}

std::optional<core::ViewMode> NavigationViewModel::previousViewMode() const
{
    return m_engine.previousViewMode();
}

void NavigationViewModel::saveState() const
{
    QSettings settings;
    settings.setValue(VIEW_MODE_KEY, core::viewModeKey(m_engine.viewMode()));
}

void NavigationViewModel::restoreState()
{
    QSettings settings;
    const QString stored = settings.value(VIEW_MODE_KEY).toString();
    auto mode = core::viewModeFromKey(stored);
    if (!mode) {
        if (!stored.isEmpty()) {
            qCWarning(lcUi) << "Unknown stored view mode" << stored;
        }
        mode = core::ViewMode::ThreeDays;
    }
    mutate([&]() { m_engine.setViewMode(*mode); });
}

void NavigationViewModel::navigate(core::NavigationUnit unit, core::NavigationDirection direction)
{
    mutate([&]() { m_engine.navigate(unit, direction); });
}

void NavigationViewModel::navigateToNextPage()
{
    mutate([&]() { m_engine.navigatePage(core::NavigationDirection::Forward); });
}

void NavigationViewModel::navigateToPreviousPage()
{
    mutate([&]() { m_engine.navigatePage(core::NavigationDirection::Backward); });
}

void NavigationViewModel::moveUpOneWeek()
{
    mutate([&]() { m_engine.moveSelectedBy(-7); });
}

void NavigationViewModel::moveDownOneWeek()
{
    mutate([&]() { m_engine.moveSelectedBy(7); });
}

void NavigationViewModel::moveLeftOneDay()
{
    mutate([&]() { m_engine.moveSelectedBy(-1); });
}

void NavigationViewModel::moveRightOneDay()
{
    mutate([&]() { m_engine.moveSelectedBy(1); });
}

void NavigationViewModel::selectDate(const QDate &date)
{
    mutate([&]() { m_engine.selectDate(date); });
}

void NavigationViewModel::clearSelection()
{
    mutate([&]() { m_engine.clearSelection(); });
}

void NavigationViewModel::goToday()
{
    mutate([&]() { m_engine.goToday(QDate::currentDate()); });
}

void NavigationViewModel::setViewMode(core::ViewMode mode)
{
    mutate([&]() { m_engine.setViewMode(mode); });
}

void NavigationViewModel::toggleYearView()
{
    mutate([&]() { m_engine.toggleYearView(); });
}

} // namespace ui
} // namespace almanac
