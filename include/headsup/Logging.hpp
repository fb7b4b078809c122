#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(HEADSUP_SCHEDULER_LOG)
Q_DECLARE_LOGGING_CATEGORY(HEADSUP_SNOOZE_LOG)
Q_DECLARE_LOGGING_CATEGORY(HEADSUP_SYNC_LOG)
Q_DECLARE_LOGGING_CATEGORY(HEADSUP_PREFS_LOG)
Q_DECLARE_LOGGING_CATEGORY(HEADSUP_DATA_LOG)
Q_DECLARE_LOGGING_CATEGORY(HEADSUP_UI_LOG)
