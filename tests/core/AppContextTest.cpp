#include <QtTest/QtTest>

#include "almanac/core/AppContext.hpp"
#include "almanac/core/HolidayResolver.hpp"
#include "almanac/data/DefaultHolidays.hpp"
#include "almanac/data/HolidayCategoryPreferences.hpp"
#include "almanac/data/HolidayRepository.hpp"

#include <QSettings>
#include <QTemporaryDir>

using namespace almanac;

namespace {
QStringList namesOn(core::AppContext &context, const QDate &date)
{
    QStringList names;
    for (const auto &occurrence : context.holidayResolver().holidaysOn(date)) {
        names << occurrence.name;
    }
    return names;
}
} // namespace

class AppContextTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void resolvesSeededCatalogForCurrentYear();
    void reloadsRepositoryChanges();
};

void AppContextTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    QCoreApplication::setOrganizationName(QStringLiteral("AlmanacTests"));
    QCoreApplication::setApplicationName(QStringLiteral("AppContextTest"));
    QSettings().clear();
}

void AppContextTest::resolvesSeededCatalogForCurrentYear()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    core::AppContext context(dir.path());

    const int year = QDate::currentDate().year();
    QCOMPARE(context.holidayResolver().referenceYear(), year);
    QCOMPARE(context.holidayResolver().definitions().size(), data::defaultHolidayDefinitions().size());

    const auto christmas = context.holidayResolver().holidaysOn(QDate(year, 12, 25));
    QCOMPARE(christmas.size(), static_cast<size_t>(1));
    QCOMPARE(christmas.front().name, QStringLiteral("Christmas Day"));

    QVERIFY(context.categoryPreferences().isEnabled(data::HolidayCategory::Religious));
}

void AppContextTest::reloadsRepositoryChanges()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    core::AppContext context(dir.path());
    const int year = QDate::currentDate().year();

    data::HolidayDefinition launch;
    launch.name = QStringLiteral("Launch");
    launch.referenceDate = QDate(year, 3, 3);
    launch.isRecurring = false;
    QVERIFY(context.holidayRepository().addDefinition(launch));
    QVERIFY(!namesOn(context, launch.referenceDate).contains(QStringLiteral("Launch")));

    context.reloadHolidays();

    QCOMPARE(namesOn(context, launch.referenceDate).count(QStringLiteral("Launch")), 1);
}

QTEST_GUILESS_MAIN(AppContextTest)
#include "AppContextTest.moc"
