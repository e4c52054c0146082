#include "test.h"

#include "sl/result.h"

using namespace sl;

namespace {

Result<int> checkedDivide(int a, int b) {
    if (b == 0) {
        return Result<int>::failure(ResultError::OUT_OF_RANGE,
                                    "Division by zero");
    }
    return Result<int>::success(a / b);
}

Result<void> requirePositive(int v) {
    if (v <= 0) {
        return Result<void>::failure(ResultError::OUT_OF_RANGE,
                                     std::string("not positive"));
    }
    return Result<void>::success();
}

} // namespace

TEST_CASE("sl::expected<T> success and failure") {
    SUBCASE("success") {
        Result<int> r = checkedDivide(10, 2);
        CHECK(r.ok());
        CHECK(static_cast<bool>(r));
        CHECK_EQ(r.value(), 5);
        CHECK_EQ(r.error(), ResultError::OK);
        CHECK_EQ(std::string(r.message()), "");
    }

    SUBCASE("failure") {
        Result<int> r = checkedDivide(1, 0);
        CHECK_FALSE(r.ok());
        CHECK_FALSE(static_cast<bool>(r));
        CHECK_EQ(r.error(), ResultError::OUT_OF_RANGE);
        CHECK_EQ(std::string(r.message()), "Division by zero");
        // Value of a failure is default constructed.
        CHECK_EQ(r.value(), 0);
    }

    SUBCASE("default constructed is a failure") {
        Result<std::string> r;
        CHECK_FALSE(r.ok());
        CHECK(r.value().empty());
    }

    SUBCASE("move keeps state") {
        Result<std::string> a = Result<std::string>::success("hello");
        Result<std::string> b(std::move(a));
        REQUIRE(b.ok());
        CHECK_EQ(b.value(), "hello");
    }
}

TEST_CASE("sl::expected<void>") {
    Result<void> good = requirePositive(3);
    CHECK(good.ok());

    Result<void> bad = requirePositive(0);
    CHECK_FALSE(bad.ok());
    CHECK_EQ(bad.error(), ResultError::OUT_OF_RANGE);
    CHECK_EQ(std::string(bad.message()), "not positive");

    Result<void> copy = bad;
    CHECK_FALSE(copy.ok());
    CHECK_EQ(std::string(copy.message()), "not positive");
}

TEST_CASE("sl::to_string(ResultError)") {
    CHECK_EQ(std::string(to_string(ResultError::OK)), "OK");
    CHECK_EQ(std::string(to_string(ResultError::OUT_OF_RANGE)), "OUT_OF_RANGE");
    CHECK_EQ(std::string(to_string(ResultError::INVALID_PATTERN)),
             "INVALID_PATTERN");
    CHECK_EQ(std::string(to_string(static_cast<ResultError>(200))), "INVALID");
}
