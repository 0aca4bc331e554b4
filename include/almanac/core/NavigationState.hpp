#pragma once

#include <QDate>
#include <optional>

#include "almanac/core/ViewMode.hpp"

namespace almanac {
namespace core {

enum class NavigationUnit
{
    Day,
    Week,
    Month,
    Year,
};

enum class NavigationDirection
{
    Forward,
    Backward,
};

struct NavigationState
{
    QDate currentAnchor;
    std::optional<QDate> selectedDate;
    ViewMode viewMode = ViewMode::ThreeDays;
};

// Inclusive day range.
struct DateRange
{
    QDate start;
    QDate end;
};

inline bool operator==(const DateRange &lhs, const DateRange &rhs)
{
    return lhs.start == rhs.start && lhs.end == rhs.end;
}

inline bool operator!=(const DateRange &lhs, const DateRange &rhs)
{
    return !(lhs == rhs);
}

} // namespace core
} // namespace almanac
