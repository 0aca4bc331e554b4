#include "almanac/data/HolidayCategoryPreferences.hpp"

#include <QSettings>

namespace almanac {
namespace data {

namespace {
QString settingsKey(HolidayCategory category)
{
    return QStringLiteral("holidays/categories/%1").arg(categoryKey(category));
}
} // namespace

HolidayCategoryPreferences::HolidayCategoryPreferences()
{
    reload();
}

bool HolidayCategoryPreferences::isEnabled(HolidayCategory category) const
{
    return m_enabled.count(category) > 0;
}

std::set<HolidayCategory> HolidayCategoryPreferences::enabledCategories() const
{
    return m_enabled;
}

void HolidayCategoryPreferences::enable(HolidayCategory category)
{
    m_enabled.insert(category);
    save();
}

void HolidayCategoryPreferences::disable(HolidayCategory category)
{
    m_enabled.erase(category);
    save();
}

void HolidayCategoryPreferences::toggle(HolidayCategory category)
{
    if (isEnabled(category)) {
        disable(category);
    } else {
        enable(category);
    }
}

void HolidayCategoryPreferences::enableAll()
{
    const auto &categories = allHolidayCategories();
    m_enabled = std::set<HolidayCategory>(categories.cbegin(), categories.cend());
    save();
}

void HolidayCategoryPreferences::disableAll()
{
    m_enabled.clear();
    save();
}

void HolidayCategoryPreferences::reload()
{
    QSettings settings;
    m_enabled.clear();
    bool hasAnyPreference = false;
    for (HolidayCategory category : allHolidayCategories()) {
        const QString key = settingsKey(category);
        if (!settings.contains(key)) {
            continue;
        }
        hasAnyPreference = true;
        if (settings.value(key).toBool()) {
            m_enabled.insert(category);
        }
    }
    if (!hasAnyPreference) {
        const auto &categories = allHolidayCategories();
        m_enabled = std::set<HolidayCategory>(categories.cbegin(), categories.cend());
    }
}

void HolidayCategoryPreferences::save() const
{
    QSettings settings;
    for (HolidayCategory category : allHolidayCategories()) {
        settings.setValue(settingsKey(category), isEnabled(category));
    }
}

} // namespace data
} // namespace almanac
