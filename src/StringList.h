#pragma once
#ifndef __INC_STRINGLIST_H
#define __INC_STRINGLIST_H

///@file StringList.h
/// central include file for StringList, includes all of the public API

/// Current StringList version number, as an integer.
/// For example, version 1.2.3 would be "1002003"
#define STRINGLIST_VERSION 1000000
#define STRINGLIST_VERSION_MAJOR 1
#define STRINGLIST_VERSION_MINOR 0
#define STRINGLIST_VERSION_PATCH 0

#include "sl/config.h"
#include "sl/io.h"
#include "sl/log.h"
#include "sl/regex.h"
#include "sl/result.h"
#include "sl/string_list.h"

#endif
