#pragma once

#include "sl/dbg.h"

#ifndef SL_WARN
#if SL_HAS_DBG
#define SL_WARN(X) _SL_LOG_AT(sl::LOG_LEVEL_WARN, X)
#define SL_WARN_IF(COND, MSG) do { if (COND) SL_WARN(MSG); } while(0)
#else
#define SL_WARN(X) SL_DBG_NO_OP(X)
#define SL_WARN_IF(COND, MSG) do { } while(0)
#endif
#endif
