#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(ptCore)
Q_DECLARE_LOGGING_CATEGORY(ptQuery)
Q_DECLARE_LOGGING_CATEGORY(ptFilter)
Q_DECLARE_LOGGING_CATEGORY(ptForensics)
Q_DECLARE_LOGGING_CATEGORY(ptRanking)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
