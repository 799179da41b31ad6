#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(vlCore, "visualoom.core")
Q_LOGGING_CATEGORY(vlStore, "visualoom.store")
Q_LOGGING_CATEGORY(vlIndex, "visualoom.index")
Q_LOGGING_CATEGORY(vlFs, "visualoom.fs")
Q_LOGGING_CATEGORY(vlSearch, "visualoom.search")
Q_LOGGING_CATEGORY(vlJobs, "visualoom.jobs")
