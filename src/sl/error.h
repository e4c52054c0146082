#pragma once

#include "sl/io.h"
#include "sl/strstream.h"

#ifndef SL_ERROR
// SL_ERROR: Supports both string literals and stream-style formatting with << operator
#define SL_ERROR(X)                                                            \
    do {                                                                       \
        if (sl::getLogLevel() >= sl::LOG_LEVEL_ERROR) {                        \
            sl::println((sl::StrStream() << "ERROR: " << X).c_str());          \
        }                                                                      \
    } while (0)
#define SL_ERROR_IF(COND, MSG) do { if (COND) SL_ERROR(MSG); } while(0)
#endif
