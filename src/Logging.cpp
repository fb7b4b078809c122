#include "headsup/Logging.hpp"

Q_LOGGING_CATEGORY(HEADSUP_SCHEDULER_LOG, "headsup.scheduler", QtInfoMsg)
Q_LOGGING_CATEGORY(HEADSUP_SNOOZE_LOG, "headsup.snooze", QtInfoMsg)
Q_LOGGING_CATEGORY(HEADSUP_SYNC_LOG, "headsup.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(HEADSUP_PREFS_LOG, "headsup.prefs", QtInfoMsg)
Q_LOGGING_CATEGORY(HEADSUP_DATA_LOG, "headsup.data", QtInfoMsg)
Q_LOGGING_CATEGORY(HEADSUP_UI_LOG, "headsup.ui", QtInfoMsg)
