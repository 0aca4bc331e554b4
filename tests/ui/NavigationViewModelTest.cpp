#include <QtTest/QtTest>

#include "almanac/core/GregorianCalendar.hpp"
#include "almanac/ui/viewmodels/NavigationViewModel.hpp"

#include <QSettings>
#include <QSignalSpy>

using namespace almanac;
using almanac::core::ViewMode;

namespace {
core::NavigationState stateAt(const QDate &anchor, std::optional<QDate> selection, ViewMode mode)
{
    core::NavigationState state;
    state.currentAnchor = anchor;
    state.selectedDate = selection;
    state.viewMode = mode;
    return state;
}
} // namespace

class NavigationViewModelTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void navigationEmitsRangeChange();
    void noOpEmitsNothing();
    void arrowKeysMoveSelection();
    void viewModeChangeIsSignalled();
    void pagingFollowsViewMode();
    void savesAndRestoresViewMode();
    void unknownStoredModeFallsBack();
};

void NavigationViewModelTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    QCoreApplication::setOrganizationName(QStringLiteral("AlmanacTests"));
    QCoreApplication::setApplicationName(QStringLiteral("NavigationViewModelTest"));
}

void NavigationViewModelTest::init()
{
    QSettings().clear();
}

void NavigationViewModelTest::navigationEmitsRangeChange()
{
    core::GregorianCalendar calendar;
    ui::NavigationViewModel model(calendar, stateAt(QDate(2025, 12, 8), std::nullopt, ViewMode::ThreeDays));
    QSignalSpy stateSpy(&model, &ui::NavigationViewModel::stateChanged);
    QSignalSpy rangeSpy(&model, &ui::NavigationViewModel::visibleRangeChanged);

    model.navigate(core::NavigationUnit::Week, core::NavigationDirection::Forward);

    QCOMPARE(model.state().currentAnchor, QDate(2025, 12, 15));
    QCOMPARE(stateSpy.count(), 1);
    QCOMPARE(rangeSpy.count(), 1);
    const QList<QVariant> arguments = rangeSpy.takeFirst();
    QCOMPARE(arguments.at(0).toDate(), QDate(2025, 12, 15));
    QCOMPARE(arguments.at(1).toDate(), QDate(2025, 12, 17));
}

void NavigationViewModelTest::noOpEmitsNothing()
{
    core::GregorianCalendar calendar;
    ui::NavigationViewModel model(calendar, stateAt(QDate(2025, 12, 8), std::nullopt, ViewMode::ThreeDays));
    QSignalSpy stateSpy(&model, &ui::NavigationViewModel::stateChanged);

    model.moveLeftOneDay();
    model.moveDownOneWeek();
    model.setViewMode(ViewMode::ThreeDays);
    model.clearSelection();

    QCOMPARE(stateSpy.count(), 0);
}

void NavigationViewModelTest::arrowKeysMoveSelection()
{
    core::GregorianCalendar calendar;
    ui::NavigationViewModel model(calendar, stateAt(QDate(2025, 12, 8), QDate(2025, 12, 8), ViewMode::TwoWeeks));
    QSignalSpy stateSpy(&model, &ui::NavigationViewModel::stateChanged);
    QSignalSpy rangeSpy(&model, &ui::NavigationViewModel::visibleRangeChanged);

    model.moveUpOneWeek();
    QCOMPARE(model.state().selectedDate, std::optional<QDate>(QDate(2025, 12, 1)));
    QCOMPARE(model.state().currentAnchor, QDate(2025, 12, 8));
    QCOMPARE(stateSpy.count(), 1);
    QCOMPARE(rangeSpy.count(), 0);

    model.moveRightOneDay();
    QCOMPARE(model.state().selectedDate, std::optional<QDate>(QDate(2025, 12, 2)));

    model.moveUpOneWeek();
    QCOMPARE(model.state().selectedDate, std::optional<QDate>(QDate(2025, 11, 25)));
    QCOMPARE(model.state().currentAnchor, QDate(2025, 11, 25));
    QCOMPARE(rangeSpy.count(), 1);
}

void NavigationViewModelTest::viewModeChangeIsSignalled()
{
    core::GregorianCalendar calendar;
    ui::NavigationViewModel model(calendar, stateAt(QDate(2025, 12, 8), std::nullopt, ViewMode::ThreeDays));
    QSignalSpy modeSpy(&model, &ui::NavigationViewModel::viewModeChanged);

    model.setViewMode(ViewMode::Month);
    QCOMPARE(modeSpy.count(), 1);
    QCOMPARE(modeSpy.takeFirst().at(0).value<ViewMode>(), ViewMode::Month);
    QCOMPARE(model.visibleRange()->start, QDate(2025, 12, 1));

    model.toggleYearView();
    model.toggleYearView();
    QCOMPARE(modeSpy.count(), 2);
    QCOMPARE(model.state().viewMode, ViewMode::Month);
    QCOMPARE(model.previousViewMode(), std::optional<ViewMode>());
}

void NavigationViewModelTest::pagingFollowsViewMode()
{
    core::GregorianCalendar calendar;
    ui::NavigationViewModel model(calendar, stateAt(QDate(2025, 12, 8), std::nullopt, ViewMode::Month));

    model.navigateToNextPage();
    QCOMPARE(model.state().currentAnchor, QDate(2026, 1, 8));

    model.toggleYearView();
    model.navigateToPreviousPage();
    QCOMPARE(model.state().currentAnchor, QDate(2025, 1, 8));
    QCOMPARE(model.visibleRange()->end, QDate(2025, 12, 31));
}

void NavigationViewModelTest::savesAndRestoresViewMode()
{
    core::GregorianCalendar calendar;
    {
        ui::NavigationViewModel model(calendar, stateAt(QDate(2025, 12, 8), std::nullopt, ViewMode::ThreeDays));
        model.setViewMode(ViewMode::TwoWeeks);
        model.saveState();
    }

    ui::NavigationViewModel restored(calendar, stateAt(QDate(2025, 12, 8), std::nullopt, ViewMode::ThreeDays));
    QSignalSpy modeSpy(&restored, &ui::NavigationViewModel::viewModeChanged);
    restored.restoreState();

    QCOMPARE(restored.state().viewMode, ViewMode::TwoWeeks);
    QCOMPARE(modeSpy.count(), 1);
    QCOMPARE(QSettings().value(QStringLiteral("navigation/viewMode")).toString(), QStringLiteral("twoWeeks"));
}

void NavigationViewModelTest::unknownStoredModeFallsBack()
{
    QSettings().setValue(QStringLiteral("navigation/viewMode"), QStringLiteral("agenda"));

    core::GregorianCalendar calendar;
    ui::NavigationViewModel model(calendar, stateAt(QDate(2025, 12, 8), std::nullopt, ViewMode::Month));
    model.restoreState();

    QCOMPARE(model.state().viewMode, ViewMode::ThreeDays);
}

QTEST_GUILESS_MAIN(NavigationViewModelTest)
#include "NavigationViewModelTest.moc"
