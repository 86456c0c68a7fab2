#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(vqCore, "vidqa.core")
Q_LOGGING_CATEGORY(vqCache, "vidqa.cache")
Q_LOGGING_CATEGORY(vqRetrieval, "vidqa.retrieval")
