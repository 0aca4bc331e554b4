#include "almanac/core/Logging.hpp"

namespace almanac {

Q_LOGGING_CATEGORY(lcData, "almanac.data")
Q_LOGGING_CATEGORY(lcUi, "almanac.ui")

} // namespace almanac
