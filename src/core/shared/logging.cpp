#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(ptCore, "peertier.core")
Q_LOGGING_CATEGORY(ptQuery, "peertier.query")
Q_LOGGING_CATEGORY(ptFilter, "peertier.filter")
Q_LOGGING_CATEGORY(ptForensics, "peertier.forensics")
Q_LOGGING_CATEGORY(ptRanking, "peertier.ranking")
