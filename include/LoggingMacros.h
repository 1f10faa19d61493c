// include/LoggingMacros.h
#ifndef LOGGING_MACROS_H
#define LOGGING_MACROS_H

// LOG_ERROR/WARN/INFO/DEBUG/VERBOSE(tag, fmt, ...) come from LogInterface.
// Firmware builds route them to Logger (USE_CUSTOM_LOGGER), native test
// builds to the library's printf fallback.
#include <LogInterface.h>

#ifdef LOG_NO_CUSTOM_LOGGER
    #ifdef USE_CUSTOM_LOGGER
        #undef USE_CUSTOM_LOGGER
    #endif
#endif

// Release firmware: the control loop logs one line per relay transition,
// per-cycle detail is compiled out
#ifdef LOG_MODE_RELEASE
    #undef LOG_DEBUG
    #undef LOG_VERBOSE
    #define LOG_DEBUG(tag, fmt, ...) ((void)0)
    #define LOG_VERBOSE(tag, fmt, ...) ((void)0)
#endif

#ifdef LOG_MODE_DEBUG_SELECTIVE
    #undef LOG_VERBOSE
    #define LOG_VERBOSE(tag, fmt, ...) ((void)0)
#endif

#endif // LOGGING_MACROS_H
