#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(rbCore, "runbar.core")
Q_LOGGING_CATEGORY(rbSearch, "runbar.search")
Q_LOGGING_CATEGORY(rbHistory, "runbar.history")
Q_LOGGING_CATEGORY(rbCatalog, "runbar.catalog")
Q_LOGGING_CATEGORY(rbPrograms, "runbar.programs")
Q_LOGGING_CATEGORY(rbFs, "runbar.fs")
