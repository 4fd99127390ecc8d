#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(imCore, "interestmapper.core")
Q_LOGGING_CATEGORY(imScoring, "interestmapper.scoring")
Q_LOGGING_CATEGORY(imText, "interestmapper.text")
Q_LOGGING_CATEGORY(imModel, "interestmapper.model")
