#pragma once

#include <QDate>
#include <QObject>
#include <map>
#include <vector>

#include "almanac/data/Holiday.hpp"

namespace almanac {
namespace core {
class HolidayResolver;
}
namespace data {
class HolidayCategoryPreferences;
}

namespace ui {

class HolidayViewModel : public QObject
{
    Q_OBJECT

public:
    HolidayViewModel(core::HolidayResolver &resolver,
                     const data::HolidayCategoryPreferences &preferences,
                     QObject *parent = nullptr);

    void setRange(const QDate &start, const QDate &end);
    QDate rangeStart() const;
    QDate rangeEnd() const;

    // Holidays of enabled categories for one date, independent of the current range.
    std::vector<data::HolidayOccurrence> holidaysOn(const QDate &date) const;
    // Dates of the current range that have at least one visible holiday.
    const std::map<QDate, std::vector<data::HolidayOccurrence>> &holidaysByDate() const;

public slots:
    void refresh();
    void showRange(const QDate &start, const QDate &end);
    // Rebuilds the snapshot when the year of today differs from the reference year.
    void handleDayChanged(const QDate &today);

signals:
    void holidaysChanged();

private:
    core::HolidayResolver &m_resolver;
    const data::HolidayCategoryPreferences &m_preferences;
    QDate m_start;
    QDate m_end;
    std::map<QDate, std::vector<data::HolidayOccurrence>> m_holidays;
};

} // namespace ui
} // namespace almanac
