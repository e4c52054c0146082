#include "test.h"

#include "sl/io.h"

using namespace sl;

namespace test_helper {
static std::string captured_output;

static void capture_print(const char *str) { captured_output += str; }
} // namespace test_helper

TEST_CASE("sl::LogLevel control") {
    SUBCASE("setLogLevel and getLogLevel") {
        uint8_t originalLevel = getLogLevel();

        setLogLevel(LOG_LEVEL_NONE);
        REQUIRE_EQ(getLogLevel(), LOG_LEVEL_NONE);

        setLogLevel(LOG_LEVEL_WARN);
        REQUIRE_EQ(getLogLevel(), LOG_LEVEL_WARN);

        setLogLevel(LOG_LEVEL_DEBUG);
        REQUIRE_EQ(getLogLevel(), LOG_LEVEL_DEBUG);

        setLogLevel(originalLevel);
    }

    SUBCASE("ScopedLogDisable suppresses and restores") {
        setLogLevel(LOG_LEVEL_DEBUG);
        inject_print_handler(test_helper::capture_print);
        inject_println_handler(test_helper::capture_print);
        test_helper::captured_output.clear();

        println("before scope");
        CHECK(test_helper::captured_output.find("before scope") !=
              std::string::npos);
        test_helper::captured_output.clear();

        {
            ScopedLogDisable guard;
            REQUIRE_EQ(getLogLevel(), LOG_LEVEL_NONE);
            println("inside scope");
            print("inside scope");
            CHECK(test_helper::captured_output.empty());
        }

        REQUIRE_EQ(getLogLevel(), LOG_LEVEL_DEBUG);
        print("after");
        CHECK_EQ(test_helper::captured_output, "after");

        clear_io_handlers();
    }
}

TEST_CASE("sl::print ignores null") {
    inject_print_handler(test_helper::capture_print);
    test_helper::captured_output.clear();
    print(nullptr);
    println(nullptr);
    CHECK(test_helper::captured_output.empty());
    clear_io_handlers();
}
