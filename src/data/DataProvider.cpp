#include "almanac/data/DataProvider.hpp"

#include "almanac/core/Logging.hpp"
#include "almanac/data/DefaultHolidays.hpp"
#include "almanac/data/FileHolidayRepository.hpp"
#include "almanac/data/HolidayCatalogStorage.hpp"

#include <QDir>
#include <QStandardPaths>

namespace almanac {
namespace data {

DataProvider::DataProvider(QString storageFolder)
{
    if (storageFolder.isEmpty()) {
        storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    }
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/almanac");
    }
    QDir dir(storageFolder);
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }
    const QString filePath = dir.filePath(QStringLiteral("holidays.ics"));

    m_catalogStorage = std::make_shared<HolidayCatalogStorage>(filePath);
    m_holidayRepository = std::make_unique<FileHolidayRepository>(m_catalogStorage);

    seedDefaultCatalog();
}

DataProvider::~DataProvider() = default;

HolidayRepository &DataProvider::holidayRepository()
{
    return *m_holidayRepository;
}

QString DataProvider::catalogFilePath() const
{
    return m_catalogStorage->filePath();
}

void DataProvider::seedDefaultCatalog()
{
    if (!m_catalogStorage->definitions().empty()) {
        return;
    }
    qCInfo(lcData) << "Seeding holiday catalog" << m_catalogStorage->filePath();
    if (!m_catalogStorage->replaceAll(defaultHolidayDefinitions())) {
        qCWarning(lcData) << "Holiday catalog could not be written; using built-in holidays in memory only";
    }
}

} // namespace data
} // namespace almanac
