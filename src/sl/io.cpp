#include "sl/io.h"

#include <string.h>

#ifdef _WIN32
#include <io.h> // for _write
#else
#include <unistd.h> // for write
#endif

namespace sl {

namespace {

// Default log level is DEBUG (all logging enabled)
uint8_t gLogLevel = LOG_LEVEL_DEBUG;

void write_native(const char *str) {
    size_t len = strlen(str);
#ifdef _WIN32
    _write(2, str, static_cast<unsigned int>(len));
#else
    while (len > 0) {
        ssize_t n = ::write(2, str, len);
        if (n <= 0) {
            return;
        }
        str += n;
        len -= static_cast<size_t>(n);
    }
#endif
}

#ifdef SL_TESTING
// Lazy initialization avoids global constructors
print_handler_t &get_print_handler() {
    static print_handler_t handler;
    return handler;
}

println_handler_t &get_println_handler() {
    static println_handler_t handler;
    return handler;
}
#endif

} // namespace

uint8_t getLogLevel() { return gLogLevel; }

void setLogLevel(uint8_t level) { gLogLevel = level; }

void print(const char *str) {
    if (!str) return;
    if (gLogLevel == LOG_LEVEL_NONE) return;

#ifdef SL_TESTING
    if (get_print_handler()) {
        get_print_handler()(str);
        return;
    }
#endif

    write_native(str);
}

void println(const char *str) {
    if (!str) return;
    if (gLogLevel == LOG_LEVEL_NONE) return;

#ifdef SL_TESTING
    if (get_println_handler()) {
        get_println_handler()(str);
        return;
    }
#endif

    write_native(str);
    write_native("\n");
}

#ifdef SL_TESTING

void inject_print_handler(const print_handler_t &handler) {
    get_print_handler() = handler;
}

void inject_println_handler(const println_handler_t &handler) {
    get_println_handler() = handler;
}

void clear_io_handlers() {
    get_print_handler() = print_handler_t();
    get_println_handler() = println_handler_t();
}

#endif // SL_TESTING

} // namespace sl
