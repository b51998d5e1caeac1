#include "todo/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcData, "todo.data", QtWarningMsg)
Q_LOGGING_CATEGORY(lcCore, "todo.core", QtWarningMsg)
Q_LOGGING_CATEGORY(lcCli, "todo.cli", QtWarningMsg)
