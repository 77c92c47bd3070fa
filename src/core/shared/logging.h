#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(rbCore)
Q_DECLARE_LOGGING_CATEGORY(rbSearch)
Q_DECLARE_LOGGING_CATEGORY(rbHistory)
Q_DECLARE_LOGGING_CATEGORY(rbCatalog)
Q_DECLARE_LOGGING_CATEGORY(rbPrograms)
Q_DECLARE_LOGGING_CATEGORY(rbFs)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
