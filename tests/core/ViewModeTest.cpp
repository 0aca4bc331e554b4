#include <QtTest/QtTest>

#include "almanac/core/ViewMode.hpp"

using namespace almanac::core;

class ViewModeTest : public QObject
{
    Q_OBJECT

private slots:
    void radiusFollowsDayCount_data();
    void radiusFollowsDayCount();
    void keysRoundTrip();
    void unknownKeyIsRejected();
    void dayModesByCount();
    void namesModes();
};

void ViewModeTest::radiusFollowsDayCount_data()
{
    QTest::addColumn<int>("mode");
    QTest::addColumn<int>("days");
    QTest::addColumn<int>("radius");

    QTest::newRow("one day") << static_cast<int>(ViewMode::OneDay) << 1 << 0;
    QTest::newRow("three days") << static_cast<int>(ViewMode::ThreeDays) << 3 << 1;
    QTest::newRow("four days") << static_cast<int>(ViewMode::FourDays) << 4 << 2;
    QTest::newRow("nine days") << static_cast<int>(ViewMode::NineDays) << 9 << 4;
    QTest::newRow("two weeks") << static_cast<int>(ViewMode::TwoWeeks) << 14 << 7;
    QTest::newRow("month") << static_cast<int>(ViewMode::Month) << 31 << 15;
    QTest::newRow("year") << static_cast<int>(ViewMode::Year) << 365 << 182;
}

void ViewModeTest::radiusFollowsDayCount()
{
    QFETCH(int, mode);
    QFETCH(int, days);
    QFETCH(int, radius);

    QCOMPARE(dayCount(static_cast<ViewMode>(mode)), days);
    QCOMPARE(halfWindowRadius(static_cast<ViewMode>(mode)), radius);
}

void ViewModeTest::keysRoundTrip()
{
    for (ViewMode mode : allViewModes()) {
        const auto parsed = viewModeFromKey(viewModeKey(mode));
        QVERIFY(parsed.has_value());
        QCOMPARE(*parsed, mode);
    }
    QCOMPARE(allViewModes().size(), static_cast<size_t>(12));
}

void ViewModeTest::unknownKeyIsRejected()
{
    QVERIFY(!viewModeFromKey(QStringLiteral("agenda")).has_value());
    QVERIFY(!viewModeFromKey(QString()).has_value());
}

void ViewModeTest::dayModesByCount()
{
    QCOMPARE(*dayViewMode(7), ViewMode::SevenDays);
    QVERIFY(!dayViewMode(14).has_value());
    QVERIFY(!dayViewMode(0).has_value());
    QVERIFY(isDayRangeMode(ViewMode::NineDays));
    QVERIFY(!isDayRangeMode(ViewMode::Month));
}

void ViewModeTest::namesModes()
{
    QCOMPARE(viewModeDisplayName(ViewMode::OneDay), QStringLiteral("One Day View"));
    QCOMPARE(viewModeDisplayName(ViewMode::ThreeDays), QStringLiteral("3 Day View"));
    QCOMPARE(viewModeDisplayName(ViewMode::TwoWeeks), QStringLiteral("2 Week View"));
    QCOMPARE(viewModeDisplayName(ViewMode::Month), QStringLiteral("Month View"));
    QCOMPARE(viewModeDisplayName(ViewMode::Year), QStringLiteral("Year View"));
}

QTEST_GUILESS_MAIN(ViewModeTest)
#include "ViewModeTest.moc"
