// src/utils/ErrorHandler.cpp
#include "ErrorHandler.h"
#include "LoggingMacros.h"

void ErrorHandler::logError(const char* tag, SystemError error, const char* context) {
    if (error == SystemError::SUCCESS) {
        return;
    }

    if (context != nullptr && context[0] != '\0') {
        LOG_ERROR(tag, "%s (code %lu): %s", errorToString(error),
                  static_cast<unsigned long>(error), context);
    } else {
        LOG_ERROR(tag, "%s (code %lu)", errorToString(error),
                  static_cast<unsigned long>(error));
    }
}
