#pragma once

#include <QString>
#include <optional>
#include <vector>

#include "almanac/data/Holiday.hpp"

namespace almanac {
namespace data {

// Holiday definitions kept in an iCalendar-style text file of VHOLIDAY blocks.
class HolidayCatalogStorage
{
public:
    explicit HolidayCatalogStorage(QString filePath);
    ~HolidayCatalogStorage() = default;

    const QString &filePath() const;
    const std::vector<HolidayDefinition> &definitions() const;

    // Mutators return false when the change could not be written back.
    bool addOrUpdateDefinition(HolidayDefinition definition);
    bool removeDefinition(const QString &name);
    bool replaceAll(std::vector<HolidayDefinition> definitions);

    static QString formatRule(const RecurrenceRule &rule);
    static std::optional<RecurrenceRule> parseRule(const QString &value);

private:
    void load();
    bool save() const;

    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);

    QString m_filePath;
    std::vector<HolidayDefinition> m_definitions;
};

} // namespace data
} // namespace almanac
