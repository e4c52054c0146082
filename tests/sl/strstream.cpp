#include "test.h"

#include "sl/strstream.h"

using namespace sl;

TEST_CASE("sl::StrStream") {
    StrStream ss;
    ss << "int " << -3 << " uint " << 7u << " size " << size_t(12);
    CHECK_EQ(ss.str(), "int -3 uint 7 size 12");

    ss.clear();
    ss << 'c' << ' ' << false << ' ' << ResultError::OUT_OF_RANGE;
    CHECK_EQ(ss.str(), "c false 1");

    ss = std::string("reset");
    CHECK_EQ(std::string(ss.c_str()), "reset");

    const char *nothing = nullptr;
    StrStream other;
    other << nothing;
    CHECK_EQ(other.str(), "(null)");
}
