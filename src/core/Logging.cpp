#include "tempo/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcEngine, "tempo.engine")
Q_LOGGING_CATEGORY(lcTemporal, "tempo.temporal")
Q_LOGGING_CATEGORY(lcData, "tempo.data")
Q_LOGGING_CATEGORY(lcSync, "tempo.sync")
