#include "almanac/data/InMemoryHolidayRepository.hpp"

#include <algorithm>

namespace almanac {
namespace data {

InMemoryHolidayRepository::InMemoryHolidayRepository() = default;

InMemoryHolidayRepository::InMemoryHolidayRepository(std::vector<HolidayDefinition> definitions)
{
    for (auto &definition : definitions) {
        addDefinition(std::move(definition));
    }
}

InMemoryHolidayRepository::~InMemoryHolidayRepository() = default;

std::vector<HolidayDefinition> InMemoryHolidayRepository::fetchDefinitions() const
{
    return m_definitions;
}

std::optional<HolidayDefinition> InMemoryHolidayRepository::findByName(const QString &name) const
{
    const auto it = find(name);
    if (it == m_definitions.cend()) {
        return std::nullopt;
    }
    return *it;
}

bool InMemoryHolidayRepository::addDefinition(HolidayDefinition definition)
{
    if (definition.name.isEmpty() || find(definition.name) != m_definitions.end()) {
        return false;
    }
    m_definitions.push_back(std::move(definition));
    return true;
}

bool InMemoryHolidayRepository::updateDefinition(const HolidayDefinition &definition)
{
    auto it = find(definition.name);
    if (it == m_definitions.end()) {
        return false;
    }
    *it = definition;
    return true;
}

bool InMemoryHolidayRepository::removeDefinition(const QString &name)
{
    auto it = find(name);
    if (it == m_definitions.end()) {
        return false;
    }
    m_definitions.erase(it);
    return true;
}

std::vector<HolidayDefinition>::iterator InMemoryHolidayRepository::find(const QString &name)
{
    return std::find_if(m_definitions.begin(), m_definitions.end(),
                        [&name](const HolidayDefinition &definition) { return definition.name == name; });
}

std::vector<HolidayDefinition>::const_iterator InMemoryHolidayRepository::find(const QString &name) const
{
    return std::find_if(m_definitions.cbegin(), m_definitions.cend(),
                        [&name](const HolidayDefinition &definition) { return definition.name == name; });
}

} // namespace data
} // namespace almanac
