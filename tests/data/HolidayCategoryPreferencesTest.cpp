#include <QtTest/QtTest>

#include "almanac/data/HolidayCategoryPreferences.hpp"

#include <QSettings>

using namespace almanac::data;

class HolidayCategoryPreferencesTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void enablesEverythingByDefault();
    void togglesAndPersists();
    void disablesAndEnablesAll();
    void readsStoredValues();
};

void HolidayCategoryPreferencesTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    QCoreApplication::setOrganizationName(QStringLiteral("AlmanacTests"));
    QCoreApplication::setApplicationName(QStringLiteral("HolidayCategoryPreferencesTest"));
}

void HolidayCategoryPreferencesTest::init()
{
    QSettings settings;
    settings.clear();
}

void HolidayCategoryPreferencesTest::enablesEverythingByDefault()
{
    HolidayCategoryPreferences preferences;
    for (HolidayCategory category : allHolidayCategories()) {
        QVERIFY(preferences.isEnabled(category));
    }
    QCOMPARE(preferences.enabledCategories().size(), allHolidayCategories().size());
}

void HolidayCategoryPreferencesTest::togglesAndPersists()
{
    {
        HolidayCategoryPreferences preferences;
        preferences.toggle(HolidayCategory::Religious);
        QVERIFY(!preferences.isEnabled(HolidayCategory::Religious));
        preferences.disable(HolidayCategory::Seasonal);
    }

    HolidayCategoryPreferences reloaded;
    QVERIFY(!reloaded.isEnabled(HolidayCategory::Religious));
    QVERIFY(!reloaded.isEnabled(HolidayCategory::Seasonal));
    QVERIFY(reloaded.isEnabled(HolidayCategory::National));

    reloaded.toggle(HolidayCategory::Religious);
    QVERIFY(reloaded.isEnabled(HolidayCategory::Religious));
}

void HolidayCategoryPreferencesTest::disablesAndEnablesAll()
{
    HolidayCategoryPreferences preferences;
    preferences.disableAll();
    QVERIFY(preferences.enabledCategories().empty());

    // An explicit "nothing enabled" survives a reload.
    preferences.reload();
    QVERIFY(preferences.enabledCategories().empty());

    preferences.enable(HolidayCategory::Cultural);
    QCOMPARE(preferences.enabledCategories(), std::set<HolidayCategory>{HolidayCategory::Cultural});

    preferences.enableAll();
    preferences.reload();
    QCOMPARE(preferences.enabledCategories().size(), allHolidayCategories().size());
}

void HolidayCategoryPreferencesTest::readsStoredValues()
{
    {
        QSettings settings;
        settings.setValue(QStringLiteral("holidays/categories/National"), false);
    }

    HolidayCategoryPreferences preferences;
    QVERIFY(!preferences.isEnabled(HolidayCategory::National));
    QVERIFY(!preferences.isEnabled(HolidayCategory::Religious));
}

QTEST_GUILESS_MAIN(HolidayCategoryPreferencesTest)
#include "HolidayCategoryPreferencesTest.moc"
