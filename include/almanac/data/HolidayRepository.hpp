#pragma once

#include <optional>
#include <vector>

#include "almanac/data/Holiday.hpp"

namespace almanac {
namespace data {

class HolidayRepository
{
public:
    virtual ~HolidayRepository() = default;

    virtual std::vector<HolidayDefinition> fetchDefinitions() const = 0;
    virtual std::optional<HolidayDefinition> findByName(const QString &name) const = 0;
    virtual bool addDefinition(HolidayDefinition definition) = 0;
    virtual bool updateDefinition(const HolidayDefinition &definition) = 0;
    virtual bool removeDefinition(const QString &name) = 0;
};

} // namespace data
} // namespace almanac
