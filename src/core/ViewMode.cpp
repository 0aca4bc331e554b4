#include "almanac/core/ViewMode.hpp"

#include <QObject>

namespace almanac {
namespace core {

const std::vector<ViewMode> &allViewModes()
{
    static const std::vector<ViewMode> modes = {
        ViewMode::OneDay,   ViewMode::TwoDays,   ViewMode::ThreeDays, ViewMode::FourDays,
        ViewMode::FiveDays, ViewMode::SixDays,   ViewMode::SevenDays, ViewMode::EightDays,
        ViewMode::NineDays, ViewMode::TwoWeeks,  ViewMode::Month,     ViewMode::Year,
    };
    return modes;
}

int dayCount(ViewMode mode)
{
    switch (mode) {
    case ViewMode::OneDay:
        return 1;
    case ViewMode::TwoDays:
        return 2;
    case ViewMode::ThreeDays:
        return 3;
    case ViewMode::FourDays:
        return 4;
    case ViewMode::FiveDays:
        return 5;
    case ViewMode::SixDays:
        return 6;
    case ViewMode::SevenDays:
        return 7;
    case ViewMode::EightDays:
        return 8;
    case ViewMode::NineDays:
        return 9;
    case ViewMode::TwoWeeks:
        return 14;
    case ViewMode::Month:
        return 31;
    case ViewMode::Year:
        return 365;
    }
    return 1;
}

int halfWindowRadius(ViewMode mode)
{
    return dayCount(mode) / 2;
}

bool isDayRangeMode(ViewMode mode)
{
    return mode != ViewMode::TwoWeeks && mode != ViewMode::Month && mode != ViewMode::Year;
}

std::optional<ViewMode> dayViewMode(int days)
{
    for (ViewMode mode : allViewModes()) {
        if (isDayRangeMode(mode) && dayCount(mode) == days) {
            return mode;
        }
    }
    return std::nullopt;
}

QString viewModeKey(ViewMode mode)
{
    switch (mode) {
    case ViewMode::OneDay:
        return QStringLiteral("oneDay");
    case ViewMode::TwoDays:
        return QStringLiteral("twoDays");
    case ViewMode::ThreeDays:
        return QStringLiteral("threeDays");
    case ViewMode::FourDays:
        return QStringLiteral("fourDays");
    case ViewMode::FiveDays:
        return QStringLiteral("fiveDays");
    case ViewMode::SixDays:
        return QStringLiteral("sixDays");
    case ViewMode::SevenDays:
        return QStringLiteral("sevenDays");
    case ViewMode::EightDays:
        return QStringLiteral("eightDays");
    case ViewMode::NineDays:
        return QStringLiteral("nineDays");
    case ViewMode::TwoWeeks:
        return QStringLiteral("twoWeeks");
    case ViewMode::Month:
        return QStringLiteral("month");
    case ViewMode::Year:
        return QStringLiteral("year");
    }
    return QString();
}

std::optional<ViewMode> viewModeFromKey(const QString &key)
{
    for (ViewMode mode : allViewModes()) {
        if (viewModeKey(mode) == key) {
            return mode;
        }
    }
    return std::nullopt;
}

QString viewModeDisplayName(ViewMode mode)
{
    switch (mode) {
    case ViewMode::OneDay:
        return QObject::tr("One Day View");
    case ViewMode::TwoWeeks:
        return QObject::tr("2 Week View");
    case ViewMode::Month:
        return QObject::tr("Month View");
    case ViewMode::Year:
        return QObject::tr("Year View");
    default:
        return QObject::tr("%1 Day View").arg(dayCount(mode));
    }
}

} // namespace core
} // namespace almanac
