#include "almanac/data/FileHolidayRepository.hpp"

#include <algorithm>

namespace almanac {
namespace data {

FileHolidayRepository::FileHolidayRepository(std::shared_ptr<HolidayCatalogStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<HolidayDefinition> FileHolidayRepository::fetchDefinitions() const
{
    if (!m_storage) {
        return {};
    }
    return m_storage->definitions();
}

std::optional<HolidayDefinition> FileHolidayRepository::findByName(const QString &name) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &definitions = m_storage->definitions();
    const auto it = std::find_if(definitions.cbegin(), definitions.cend(),
                                 [&name](const HolidayDefinition &definition) { return definition.name == name; });
    if (it == definitions.cend()) {
        return std::nullopt;
    }
    return *it;
}

bool FileHolidayRepository::addDefinition(HolidayDefinition definition)
{
    if (!m_storage || definition.name.isEmpty() || findByName(definition.name)) {
        return false;
    }
    return m_storage->addOrUpdateDefinition(std::move(definition));
}

bool FileHolidayRepository::updateDefinition(const HolidayDefinition &definition)
{
    if (!m_storage || !findByName(definition.name)) {
        return false;
    }
    return m_storage->addOrUpdateDefinition(definition);
}

bool FileHolidayRepository::removeDefinition(const QString &name)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeDefinition(name);
}

} // namespace data
} // namespace almanac
