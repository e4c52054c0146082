#pragma once

#include "sl/config.h"
#include "sl/io.h"
#include "sl/strstream.h"

namespace sl {
// ".build/src/sl/dbg.h" -> "src/sl/dbg.h"
// "blah/blah/blah.h" -> "blah.h"
inline const char *file_offset(const char *file) {
    const char *p = file;
    const char *last_slash = nullptr;

    while (*p) {
        if (p[0] == 's' && p[1] == 'r' && p[2] == 'c' && p[3] == '/') {
            return p;
        }
        if (*p == '/') { // fallback to using last slash
            last_slash = p;
        }
        p++;
    }
    if (last_slash) {
        return last_slash + 1;
    }
    return file;
}
} // namespace sl

// Emits "file(line): " followed by the streamed expression when the global
// log level is at least LEVEL.
#define _SL_LOG_AT(LEVEL, X)                                                   \
    do {                                                                       \
        if (sl::getLogLevel() >= (LEVEL)) {                                    \
            sl::println((sl::StrStream() << sl::file_offset(__FILE__) << "("  \
                                         << int(__LINE__) << "): " << X)       \
                            .c_str());                                         \
        }                                                                      \
    } while (0)

// Swallows the expression, including any << chain, without evaluating it.
#define SL_DBG_NO_OP(X)                                                        \
    do {                                                                       \
        if (false) {                                                           \
            sl::StrStream() << X;                                              \
        }                                                                      \
    } while (0)

#ifdef SL_FORCE_DBG
#define SL_HAS_DBG 1
#define SL_DBG(X) _SL_LOG_AT(sl::LOG_LEVEL_DEBUG, X)
#else
#define SL_HAS_DBG 0
#define SL_DBG(X) SL_DBG_NO_OP(X)
#endif

#ifndef SL_DBG_IF
#define SL_DBG_IF(COND, MSG)                                                   \
    if (COND)                                                                  \
    SL_DBG(MSG)
#endif // SL_DBG_IF
