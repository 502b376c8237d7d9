#include "pawpal/core/Logging.hpp"

namespace pawpal {

Q_LOGGING_CATEGORY(lcData, "pawpal.data")
Q_LOGGING_CATEGORY(lcScheduler, "pawpal.scheduler")
Q_LOGGING_CATEGORY(lcContext, "pawpal.context")

} // namespace pawpal
