#ifndef __INC_STRINGLIST_CONFIG_H
#define __INC_STRINGLIST_CONFIG_H

///@file config.h
/// contains definitions that can be used to configure StringList at compile time

// Build for the unit tests. Enables injection of print handlers (see sl/io.h) and
// forces debug output on, even when RELEASE is defined.
// #define SL_TESTING

// Define RELEASE to compile SL_DBG and SL_WARN down to no-ops. SL_ERROR is never
// compiled out.
// #define RELEASE

// Per-category trace output. Each category is off unless enabled here or with -D.
// #define STRINGLIST_LOG_LIST_ENABLED
// #define STRINGLIST_LOG_REGEX_ENABLED

// Memory budget in bytes for each compiled pattern (RE2::Options::max_mem).
// Patterns too large to fit fail to compile with ResultError::INVALID_PATTERN.
#ifndef STRINGLIST_REGEX_MAX_MEM
#define STRINGLIST_REGEX_MAX_MEM (8 << 20)
#endif

#if defined(SL_TESTING) || !defined(RELEASE)
#define SL_FORCE_DBG 1
#endif

#endif
