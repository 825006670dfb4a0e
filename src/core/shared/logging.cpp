#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(nvCore, "notevault.core")
Q_LOGGING_CATEGORY(nvStore, "notevault.store")
Q_LOGGING_CATEGORY(nvSync, "notevault.sync")
Q_LOGGING_CATEGORY(nvFs, "notevault.fs")
Q_LOGGING_CATEGORY(nvEmbedding, "notevault.embedding")
