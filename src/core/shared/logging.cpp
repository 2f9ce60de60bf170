#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(dqCore, "docqa.core", QtInfoMsg)
Q_LOGGING_CATEGORY(dqIngest, "docqa.ingest", QtInfoMsg)
Q_LOGGING_CATEGORY(dqStore, "docqa.store", QtInfoMsg)
Q_LOGGING_CATEGORY(dqRanking, "docqa.ranking", QtInfoMsg)
Q_LOGGING_CATEGORY(dqCache, "docqa.cache", QtInfoMsg)
Q_LOGGING_CATEGORY(dqQuery, "docqa.query", QtInfoMsg)
