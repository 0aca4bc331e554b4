#include <QtTest/QtTest>

#include "almanac/data/InMemoryHolidayRepository.hpp"

using namespace almanac::data;

namespace {
HolidayDefinition makeHoliday(const QString &name, const QDate &date)
{
    HolidayDefinition definition;
    definition.name = name;
    definition.referenceDate = date;
    definition.category = HolidayCategory::Cultural;
    return definition;
}
} // namespace

class HolidayRepositoryTest : public QObject
{
    Q_OBJECT

private slots:
    void addAndFetch();
    void rejectsDuplicateAndEmptyNames();
    void updateAndRemove();
    void keepsInsertionOrder();
};

void HolidayRepositoryTest::addAndFetch()
{
    InMemoryHolidayRepository repo;
    QVERIFY(repo.addDefinition(makeHoliday(QStringLiteral("Pi Day"), QDate(2024, 3, 14))));

    const auto list = repo.fetchDefinitions();
    QCOMPARE(list.size(), static_cast<size_t>(1));
    QCOMPARE(list.front().name, QStringLiteral("Pi Day"));
    QCOMPARE(list.front().category, HolidayCategory::Cultural);

    const auto fetched = repo.findByName(QStringLiteral("Pi Day"));
    QVERIFY(fetched.has_value());
    QCOMPARE(fetched->referenceDate, QDate(2024, 3, 14));
    QVERIFY(!repo.findByName(QStringLiteral("Tau Day")).has_value());
}

void HolidayRepositoryTest::rejectsDuplicateAndEmptyNames()
{
    InMemoryHolidayRepository repo;
    QVERIFY(repo.addDefinition(makeHoliday(QStringLiteral("Pi Day"), QDate(2024, 3, 14))));
    QVERIFY(!repo.addDefinition(makeHoliday(QStringLiteral("Pi Day"), QDate(2024, 7, 22))));
    QVERIFY(!repo.addDefinition(makeHoliday(QString(), QDate(2024, 7, 22))));

    QCOMPARE(repo.fetchDefinitions().size(), static_cast<size_t>(1));
    QCOMPARE(repo.findByName(QStringLiteral("Pi Day"))->referenceDate, QDate(2024, 3, 14));
}

void HolidayRepositoryTest::updateAndRemove()
{
    InMemoryHolidayRepository repo;
    repo.addDefinition(makeHoliday(QStringLiteral("Pi Day"), QDate(2024, 3, 14)));

    HolidayDefinition toUpdate = *repo.findByName(QStringLiteral("Pi Day"));
    toUpdate.description = QStringLiteral("3.14");
    QVERIFY(repo.updateDefinition(toUpdate));
    QCOMPARE(repo.findByName(QStringLiteral("Pi Day"))->description, QStringLiteral("3.14"));

    QVERIFY(!repo.updateDefinition(makeHoliday(QStringLiteral("Tau Day"), QDate(2024, 6, 28))));

    QVERIFY(repo.removeDefinition(QStringLiteral("Pi Day")));
    QVERIFY(!repo.findByName(QStringLiteral("Pi Day")).has_value());
    QVERIFY(!repo.removeDefinition(QStringLiteral("Pi Day")));
}

void HolidayRepositoryTest::keepsInsertionOrder()
{
    InMemoryHolidayRepository repo({makeHoliday(QStringLiteral("B"), QDate(2024, 1, 2)),
                                    makeHoliday(QStringLiteral("A"), QDate(2024, 1, 1)),
                                    makeHoliday(QStringLiteral("B"), QDate(2024, 1, 3))});

    const auto list = repo.fetchDefinitions();
    QCOMPARE(list.size(), static_cast<size_t>(2));
    QCOMPARE(list[0].name, QStringLiteral("B"));
    QCOMPARE(list[0].referenceDate, QDate(2024, 1, 2));
    QCOMPARE(list[1].name, QStringLiteral("A"));
}

QTEST_GUILESS_MAIN(HolidayRepositoryTest)
#include "HolidayRepositoryTest.moc"
