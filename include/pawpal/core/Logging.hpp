#pragma once

#include <QLoggingCategory>

namespace pawpal {

Q_DECLARE_LOGGING_CATEGORY(lcData)
Q_DECLARE_LOGGING_CATEGORY(lcScheduler)
Q_DECLARE_LOGGING_CATEGORY(lcContext)

} // namespace pawpal
