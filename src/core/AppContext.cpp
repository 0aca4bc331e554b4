#include "almanac/core/AppContext.hpp"

#include "almanac/data/DataProvider.hpp"
#include "almanac/data/HolidayCategoryPreferences.hpp"
#include "almanac/data/HolidayRepository.hpp"

#include "almanac/core/GregorianCalendar.hpp"
#include "almanac/core/HolidayResolver.hpp"

namespace almanac {
namespace core {

AppContext::AppContext(QString storageFolder)
    : m_calendar(std::make_unique<GregorianCalendar>())
    , m_dataProvider(std::make_unique<data::DataProvider>(std::move(storageFolder)))
    , m_categoryPreferences(std::make_unique<data::HolidayCategoryPreferences>())
    , m_holidayResolver(std::make_unique<HolidayResolver>(*m_calendar))
{
    m_holidayResolver->refreshIfNeeded(QDate::currentDate());
    reloadHolidays();
}

AppContext::~AppContext() = default;

const CalendarSystem &AppContext::calendar() const
{
    return *m_calendar;
}

data::HolidayRepository &AppContext::holidayRepository()
{
    return m_dataProvider->holidayRepository();
}

data::HolidayCategoryPreferences &AppContext::categoryPreferences()
{
    return *m_categoryPreferences;
}

HolidayResolver &AppContext::holidayResolver()
{
    return *m_holidayResolver;
}

void AppContext::reloadHolidays()
{
    m_holidayResolver->setDefinitions(m_dataProvider->holidayRepository().fetchDefinitions());
}

} // namespace core
} // namespace almanac
