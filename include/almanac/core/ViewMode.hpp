#pragma once

#include <QMetaType>
#include <QString>
#include <optional>
#include <vector>

namespace almanac {
namespace core {

enum class ViewMode
{
    OneDay,
    TwoDays,
    ThreeDays,
    FourDays,
    FiveDays,
    SixDays,
    SevenDays,
    EightDays,
    NineDays,
    TwoWeeks,
    Month,
    Year,
};

const std::vector<ViewMode> &allViewModes();

// Nominal number of days shown by the mode (31 for month, 365 for year).
int dayCount(ViewMode mode);

// Half-window radius used by the selection stability rule in day and two-week views.
// Month and year views test against their visible range instead.
int halfWindowRadius(ViewMode mode);

// Views showing a fixed number of consecutive days starting at the anchor.
bool isDayRangeMode(ViewMode mode);

std::optional<ViewMode> dayViewMode(int days);

QString viewModeKey(ViewMode mode);
std::optional<ViewMode> viewModeFromKey(const QString &key);
QString viewModeDisplayName(ViewMode mode);

} // namespace core
} // namespace almanac

Q_DECLARE_METATYPE(almanac::core::ViewMode)
