#include "almanac/ui/viewmodels/HolidayViewModel.hpp"

#include "almanac/core/HolidayResolver.hpp"
#include "almanac/core/Logging.hpp"
#include "almanac/data/HolidayCategoryPreferences.hpp"

#include <algorithm>

namespace almanac {
namespace ui {

HolidayViewModel::HolidayViewModel(core::HolidayResolver &resolver,
                                   const data::HolidayCategoryPreferences &preferences,
                                   QObject *parent)
    : QObject(parent)
    , m_resolver(resolver)
    , m_preferences(preferences)
{
}

void HolidayViewModel::setRange(const QDate &start, const QDate &end)
{
    if (!start.isValid() || !end.isValid() || end < start) {
        return;
    }
    m_start = start;
    m_end = end;
}

QDate HolidayViewModel::rangeStart() const
{
    return m_start;
}

QDate HolidayViewModel::rangeEnd() const
{
    return m_end;
}

std::vector<data::HolidayOccurrence> HolidayViewModel::holidaysOn(const QDate &date) const
{
    auto holidays = m_resolver.holidaysOn(date);
    holidays.erase(std::remove_if(holidays.begin(), holidays.end(),
                                  [this](const data::HolidayOccurrence &occurrence) {
                                      return !m_preferences.isEnabled(occurrence.category);
                                  }),
                   holidays.end());
    return holidays;
}

const std::map<QDate, std::vector<data::HolidayOccurrence>> &HolidayViewModel::holidaysByDate() const
{
    return m_holidays;
}

void HolidayViewModel::refresh()
{
    if (!m_start.isValid() || !m_end.isValid()) {
        return;
    }
    m_holidays.clear();
    for (QDate date = m_start; date <= m_end; date = date.addDays(1)) {
        auto holidays = holidaysOn(date);
        if (!holidays.empty()) {
            m_holidays.emplace(date, std::move(holidays));
        }
    }
    qCDebug(lcUi) << "Holidays refreshed" << m_start << m_end << m_holidays.size();
    emit holidaysChanged();
}

void HolidayViewModel::handleDayChanged(const QDate &today)
{
    if (!m_resolver.refreshIfNeeded(today)) {
        return;
    }
    qCInfo(lcUi) << "Holiday snapshot rebuilt for" << m_resolver.referenceYear();
    refresh();
}

void HolidayViewModel::showRange(const QDate &start, const QDate &end)
{
    setRange(start, end);
    refresh();
}

} // namespace ui
} // namespace almanac
