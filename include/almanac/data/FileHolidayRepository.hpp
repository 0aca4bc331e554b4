#pragma once

#include "almanac/data/HolidayCatalogStorage.hpp"
#include "almanac/data/HolidayRepository.hpp"

#include <memory>

namespace almanac {
namespace data {

class FileHolidayRepository : public HolidayRepository
{
public:
    explicit FileHolidayRepository(std::shared_ptr<HolidayCatalogStorage> storage);
    ~FileHolidayRepository() override = default;

    std::vector<HolidayDefinition> fetchDefinitions() const override;
    std::optional<HolidayDefinition> findByName(const QString &name) const override;
    bool addDefinition(HolidayDefinition definition) override;
    bool updateDefinition(const HolidayDefinition &definition) override;
    bool removeDefinition(const QString &name) override;

private:
    std::shared_ptr<HolidayCatalogStorage> m_storage;
};

} // namespace data
} // namespace almanac
