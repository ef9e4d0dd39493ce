/*
 * SelfieLight - Logging categories
 *
 * Debug output is off by default, enable it with
 *   QT_LOGGING_RULES="selfielight.*.debug=true"
 * License: MIT
 */

#include "logging.h"

Q_LOGGING_CATEGORY(lcSettings, "selfielight.settings", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSurface, "selfielight.surface", QtInfoMsg)
Q_LOGGING_CATEGORY(lcController, "selfielight.controller", QtInfoMsg)
Q_LOGGING_CATEGORY(lcOverlay, "selfielight.overlay", QtInfoMsg)
