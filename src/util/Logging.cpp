#include "Logging.h"

// Per-tick chatter stays at debug level; enable with
// QT_LOGGING_RULES="reelforge.*.debug=true"
Q_LOGGING_CATEGORY(lcTimeline, "reelforge.timeline", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSync, "reelforge.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(lcMedia, "reelforge.media", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRender, "reelforge.render", QtInfoMsg)
Q_LOGGING_CATEGORY(lcExport, "reelforge.export", QtInfoMsg)
Q_LOGGING_CATEGORY(lcEngine, "reelforge.engine", QtInfoMsg)
