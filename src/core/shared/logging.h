#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(vCore)
Q_DECLARE_LOGGING_CATEGORY(vApps)
Q_DECLARE_LOGGING_CATEGORY(vFiles)
Q_DECLARE_LOGGING_CATEGORY(vWindows)
Q_DECLARE_LOGGING_CATEGORY(vScripts)
Q_DECLARE_LOGGING_CATEGORY(vQuery)
Q_DECLARE_LOGGING_CATEGORY(vIpc)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
