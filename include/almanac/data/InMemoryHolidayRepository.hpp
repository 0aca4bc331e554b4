#pragma once

#include "almanac/data/HolidayRepository.hpp"

namespace almanac {
namespace data {

class InMemoryHolidayRepository : public HolidayRepository
{
public:
    InMemoryHolidayRepository();
    explicit InMemoryHolidayRepository(std::vector<HolidayDefinition> definitions);
    ~InMemoryHolidayRepository() override;

    std::vector<HolidayDefinition> fetchDefinitions() const override;
    std::optional<HolidayDefinition> findByName(const QString &name) const override;
    bool addDefinition(HolidayDefinition definition) override;
    bool updateDefinition(const HolidayDefinition &definition) override;
    bool removeDefinition(const QString &name) override;

private:
    std::vector<HolidayDefinition>::iterator find(const QString &name);
    std::vector<HolidayDefinition>::const_iterator find(const QString &name) const;

    // Insertion order is kept; it decides snapshot order for holidays on the same day.
    std::vector<HolidayDefinition> m_definitions;
};

} // namespace data
} // namespace almanac
