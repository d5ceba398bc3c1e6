#include "AppLogging.hpp"

Q_LOGGING_CATEGORY(tscpTransfer, "tscp.transfer")
Q_LOGGING_CATEGORY(tscpSession, "tscp.session")
Q_LOGGING_CATEGORY(tscpCli, "tscp.cli")
