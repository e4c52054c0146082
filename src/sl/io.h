#pragma once

#include <stdint.h>

#ifdef SL_TESTING
#include <functional>
#endif

namespace sl {

// =============================================================================
// Global Log Level Control
// =============================================================================
// Runtime-configurable log level that can dynamically shut off logging.
// This affects SL_DBG, SL_WARN and SL_ERROR since they all flow through
// sl::print/sl::println.

/// Log level constants - higher values include more output
enum LogLevel : uint8_t {
    LOG_LEVEL_NONE  = 0,  ///< No logging (completely silent)
    LOG_LEVEL_ERROR = 1,  ///< Only errors
    LOG_LEVEL_WARN  = 2,  ///< Errors and warnings
    LOG_LEVEL_DEBUG = 3,  ///< All logging including debug (default)
};

/// Get the current global log level
uint8_t getLogLevel();

/// Set the global log level
/// @note Setting to LOG_LEVEL_NONE disables all logging output
void setLogLevel(uint8_t level);

/// @brief RAII class to temporarily disable all logging output
///
/// When the object is destroyed, the previous log level is restored.
/// @code
/// {
///     sl::ScopedLogDisable guard;
///     list.insert("x", 99);   // range warning suppressed
/// }
/// @endcode
class ScopedLogDisable {
  public:
    ScopedLogDisable() : mPreviousLevel(getLogLevel()) {
        setLogLevel(LOG_LEVEL_NONE);
    }

    ~ScopedLogDisable() { setLogLevel(mPreviousLevel); }

    ScopedLogDisable(const ScopedLogDisable &) = delete;
    ScopedLogDisable &operator=(const ScopedLogDisable &) = delete;

  private:
    uint8_t mPreviousLevel;
};

// Print a string without newline. Writes to stderr on hosted platforms.
void print(const char *str);

// Print a string with newline
void println(const char *str);

#ifdef SL_TESTING

using print_handler_t = std::function<void(const char *)>;
using println_handler_t = std::function<void(const char *)>;

// Inject function handlers for testing
void inject_print_handler(const print_handler_t &handler);
void inject_println_handler(const println_handler_t &handler);

// Clear all injected handlers (restores default behavior)
void clear_io_handlers();

#endif // SL_TESTING

} // namespace sl
