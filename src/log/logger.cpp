#include "logger.hpp"

Q_LOGGING_CATEGORY(LC_APP,   "speaker.app", QtInfoMsg)
Q_LOGGING_CATEGORY(LC_MATCH, "speaker.match", QtInfoMsg)
Q_LOGGING_CATEGORY(LC_SUGG,  "speaker.suggest", QtInfoMsg)
Q_LOGGING_CATEGORY(LC_RETRO, "speaker.retro", QtInfoMsg)
Q_LOGGING_CATEGORY(LC_MERGE, "speaker.merge", QtInfoMsg)
Q_LOGGING_CATEGORY(LC_STORE, "speaker.store", QtInfoMsg)
