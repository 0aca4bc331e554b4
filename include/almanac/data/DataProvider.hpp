#pragma once

#include <memory>
#include <QString>

namespace almanac {
namespace data {

class HolidayRepository;
class HolidayCatalogStorage;

class DataProvider
{
public:
    // An empty folder selects the application data location.
    explicit DataProvider(QString storageFolder = QString());
    ~DataProvider();

    HolidayRepository &holidayRepository();
    QString catalogFilePath() const;

private:
    void seedDefaultCatalog();

    std::shared_ptr<HolidayCatalogStorage> m_catalogStorage;
    std::unique_ptr<HolidayRepository> m_holidayRepository;
};

} // namespace data
} // namespace almanac
