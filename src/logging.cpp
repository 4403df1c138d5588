#include "logging.hpp"

Q_LOGGING_CATEGORY(lcMain, "quakewatch.main")
Q_LOGGING_CATEGORY(lcFeed, "quakewatch.feed")
Q_LOGGING_CATEGORY(lcScheduler, "quakewatch.scheduler")
Q_LOGGING_CATEGORY(lcDedup, "quakewatch.dedup")
