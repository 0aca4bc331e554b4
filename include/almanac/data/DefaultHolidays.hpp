#pragma once

#include <vector>

#include "almanac/data/Holiday.hpp"

namespace almanac {
namespace data {

// Built-in catalog used when no catalog file exists yet.
std::vector<HolidayDefinition> defaultHolidayDefinitions();

} // namespace data
} // namespace almanac
