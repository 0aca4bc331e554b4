#pragma once

#include <memory>
#include <QString>

namespace almanac {
namespace data {
class DataProvider;
class HolidayRepository;
class HolidayCategoryPreferences;
}

namespace core {

class CalendarSystem;
class HolidayResolver;

class AppContext
{
public:
    explicit AppContext(QString storageFolder = QString());
    ~AppContext();

    const CalendarSystem &calendar() const;
    data::HolidayRepository &holidayRepository();
    data::HolidayCategoryPreferences &categoryPreferences();
    HolidayResolver &holidayResolver();

    // Pushes the repository's current definitions into the resolver.
    void reloadHolidays();

private:
    std::unique_ptr<CalendarSystem> m_calendar;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<data::HolidayCategoryPreferences> m_categoryPreferences;
    std::unique_ptr<HolidayResolver> m_holidayResolver;
};

} // namespace core
} // namespace almanac
