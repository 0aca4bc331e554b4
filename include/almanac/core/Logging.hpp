#pragma once

#include <QLoggingCategory>

namespace almanac {

Q_DECLARE_LOGGING_CATEGORY(lcData)
Q_DECLARE_LOGGING_CATEGORY(lcUi)

} // namespace almanac
