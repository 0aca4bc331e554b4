#pragma once

#include <set>

#include "almanac/data/Holiday.hpp"

namespace almanac {
namespace data {

// Which holiday categories are shown. Stored in QSettings; every category is enabled until
// the user changes something.
class HolidayCategoryPreferences
{
public:
    HolidayCategoryPreferences();

    bool isEnabled(HolidayCategory category) const;
    std::set<HolidayCategory> enabledCategories() const;

    void enable(HolidayCategory category);
    void disable(HolidayCategory category);
    void toggle(HolidayCategory category);
    void enableAll();
    void disableAll();

    void reload();

private:
    void save() const;

    std::set<HolidayCategory> m_enabled;
};

} // namespace data
} // namespace almanac
