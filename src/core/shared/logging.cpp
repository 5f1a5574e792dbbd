#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(vCore, "vanta.core", QtInfoMsg)
Q_LOGGING_CATEGORY(vApps, "vanta.apps", QtInfoMsg)
Q_LOGGING_CATEGORY(vFiles, "vanta.files", QtInfoMsg)
Q_LOGGING_CATEGORY(vWindows, "vanta.windows", QtInfoMsg)
Q_LOGGING_CATEGORY(vScripts, "vanta.scripts", QtInfoMsg)
Q_LOGGING_CATEGORY(vQuery, "vanta.query", QtInfoMsg)
Q_LOGGING_CATEGORY(vIpc, "vanta.ipc", QtInfoMsg)
