#include "dayplan/core/Logging.hpp"

Q_LOGGING_CATEGORY(DAYPLAN_HISTORY_LOG, "dayplan.history", QtInfoMsg)
Q_LOGGING_CATEGORY(DAYPLAN_INDEX_LOG, "dayplan.index", QtInfoMsg)
Q_LOGGING_CATEGORY(DAYPLAN_PERSISTENCE_LOG, "dayplan.persistence", QtInfoMsg)
Q_LOGGING_CATEGORY(DAYPLAN_CACHE_LOG, "dayplan.cache", QtInfoMsg)
Q_LOGGING_CATEGORY(DAYPLAN_SCHEDULER_LOG, "dayplan.scheduler", QtInfoMsg)
Q_LOGGING_CATEGORY(DAYPLAN_HOOK_LOG, "dayplan.hook", QtInfoMsg)
