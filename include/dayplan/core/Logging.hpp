#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(DAYPLAN_HISTORY_LOG)
Q_DECLARE_LOGGING_CATEGORY(DAYPLAN_INDEX_LOG)
Q_DECLARE_LOGGING_CATEGORY(DAYPLAN_PERSISTENCE_LOG)
Q_DECLARE_LOGGING_CATEGORY(DAYPLAN_CACHE_LOG)
Q_DECLARE_LOGGING_CATEGORY(DAYPLAN_SCHEDULER_LOG)
Q_DECLARE_LOGGING_CATEGORY(DAYPLAN_HOOK_LOG)
