#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(dqCore)
Q_DECLARE_LOGGING_CATEGORY(dqIngest)
Q_DECLARE_LOGGING_CATEGORY(dqStore)
Q_DECLARE_LOGGING_CATEGORY(dqRanking)
Q_DECLARE_LOGGING_CATEGORY(dqCache)
Q_DECLARE_LOGGING_CATEGORY(dqQuery)

// printf-style wrappers over the categorized Qt logging macros.
// Enable per category with QT_LOGGING_RULES, e.g. "docqa.ingest.debug=true".
#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
