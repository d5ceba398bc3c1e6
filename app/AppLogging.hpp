// Logging categories of the front end (filter with QT_LOGGING_RULES).
#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(tscpTransfer)
Q_DECLARE_LOGGING_CATEGORY(tscpSession)
Q_DECLARE_LOGGING_CATEGORY(tscpCli)
