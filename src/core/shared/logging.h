#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(nvCore)
Q_DECLARE_LOGGING_CATEGORY(nvStore)
Q_DECLARE_LOGGING_CATEGORY(nvSync)
Q_DECLARE_LOGGING_CATEGORY(nvFs)
Q_DECLARE_LOGGING_CATEGORY(nvEmbedding)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
