#pragma once

#include "almanac/core/CalendarSystem.hpp"

namespace almanac {
namespace core {

class GregorianCalendar : public CalendarSystem
{
public:
    GregorianCalendar();
    ~GregorianCalendar() override;

    std::optional<QDate> dateFromComponents(int year, int month, int day) const override;
    DateComponents components(const QDate &date) const override;
    std::optional<QDate> dateByAdding(CalendarUnit unit, int value, const QDate &date) const override;
    bool isSameDay(const QDate &lhs, const QDate &rhs) const override;
};

} // namespace core
} // namespace almanac
