#include "Logging.h"

Q_LOGGING_CATEGORY(lcDb, "medstock.db")
Q_LOGGING_CATEGORY(lcOrder, "medstock.order")
Q_LOGGING_CATEGORY(lcLoss, "medstock.losses")
Q_LOGGING_CATEGORY(lcExport, "medstock.export")
Q_LOGGING_CATEGORY(lcUi, "medstock.ui")
