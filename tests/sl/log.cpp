#include "test.h"

#include "sl/log.h"

using namespace sl;

TEST_CASE("sl::file_offset") {
    CHECK_EQ(std::string(file_offset("src/sl/dbg.h")), "src/sl/dbg.h");
    CHECK_EQ(std::string(file_offset(".build/src/sl/dbg.h")), "src/sl/dbg.h");
    CHECK_EQ(std::string(file_offset("blah/blah/blah.h")), "blah.h");
    CHECK_EQ(std::string(file_offset("plain.h")), "plain.h");
}

TEST_CASE("SL_WARN and SL_ERROR formatting") {
    setLogLevel(LOG_LEVEL_DEBUG);
    test_helper::CaptureLog log;

    SL_ERROR("code " << 7);
    REQUIRE_EQ(log.lines().size(), 1u);
    CHECK_EQ(log.lines()[0], "ERROR: code 7");

#if SL_HAS_DBG
    SL_WARN("value=" << 42 << " ok=" << true);
    REQUIRE_EQ(log.lines().size(), 2u);
    CHECK(log.lines()[1].find("log.cpp(") != std::string::npos);
    CHECK(log.lines()[1].find("): value=42 ok=true") != std::string::npos);
#endif
}

TEST_CASE("log level filters the macros") {
    test_helper::CaptureLog log;

    setLogLevel(LOG_LEVEL_ERROR);
    SL_WARN("hidden");
    SL_DBG("hidden");
    SL_ERROR("shown");
    setLogLevel(LOG_LEVEL_DEBUG);

    REQUIRE_EQ(log.lines().size(), 1u);
    CHECK_EQ(log.lines()[0], "ERROR: shown");
}

TEST_CASE("disabled categories do not evaluate their arguments") {
    int evaluated = 0;
    SL_DBG_NO_OP("x" << ++evaluated);
#ifndef STRINGLIST_LOG_LIST_ENABLED
    SL_LOG_LIST("x" << ++evaluated);
#endif
    CHECK_EQ(evaluated, 0);
}
