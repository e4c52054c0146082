#pragma once

#include "sl/dbg.h"
#include "sl/error.h"
#include "sl/warn.h"

/// @file sl/log.h
/// @brief Logging categories for the StringList subsystems
///
/// Each category can be independently enabled via preprocessor defines at
/// compile-time. Disabled categories produce no code.
///
/// Example:
///   #define STRINGLIST_LOG_REGEX_ENABLED
///   #include "sl/log.h"
///
///   SL_LOG_REGEX("compiled " << pattern);

/// @brief List mutation tracing (insert, remove, sort)
#ifdef STRINGLIST_LOG_LIST_ENABLED
    #define SL_LOG_LIST(X) SL_WARN(X)
#else
    #define SL_LOG_LIST(X) SL_DBG_NO_OP(X)
#endif

/// @brief Pattern compilation and matching
#ifdef STRINGLIST_LOG_REGEX_ENABLED
    #define SL_LOG_REGEX(X) SL_WARN(X)
#else
    #define SL_LOG_REGEX(X) SL_DBG_NO_OP(X)
#endif
