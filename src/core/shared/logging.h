#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(vlCore)
Q_DECLARE_LOGGING_CATEGORY(vlStore)
Q_DECLARE_LOGGING_CATEGORY(vlIndex)
Q_DECLARE_LOGGING_CATEGORY(vlFs)
Q_DECLARE_LOGGING_CATEGORY(vlSearch)
Q_DECLARE_LOGGING_CATEGORY(vlJobs)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
