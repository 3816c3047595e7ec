#include <doctest/doctest.h>
#include "SmoothSizeUtil/String.h"
#include "SmoothSizeUtil/Exceptions.h"

#include <vector>

using namespace SmoothSize;
using namespace SmoothSize::String;

TEST_CASE("string format")
{
    SUBCASE("ordered positional") {
        CHECK("abc" == format("a%sc", "b"));
    }
    SUBCASE("numbered positional ") {
        CHECK("cba" == format("%2%b%1%", "a", "c"));
    }
    SUBCASE("integers") {
        CHECK("125 = 5^3" == format("%d = %d^%d", 125L, 5, 3));
    }
}

TEST_CASE("string split and join")
{
    CHECK(split("stderr:debug") == std::vector<std::string>{"stderr", "debug"});
    CHECK(split("").empty());
    CHECK(split("2, 3,5", ", ") == std::vector<std::string>{"2", "3", "5"});

    auto [sink, level] = parse_pair("out.log:trace");
    CHECK(sink == "out.log");
    CHECK(level == "trace");
    auto [only, none] = parse_pair("stdout");
    CHECK(only == "stdout");
    CHECK(none.empty());

    CHECK(join(std::vector<long>{2, 3, 5, 7}) == "2,3,5,7");
    CHECK(join(std::vector<std::string>{"a", "b"}, " * ") == "a * b");
    CHECK(join(std::vector<int>{}).empty());
}

TEST_CASE("string raise")
{
    try {
        raise<ValueError>("bad factor %d", 1);
        FAIL("raise did not throw");
    }
    catch (const ValueError& err) {
        CHECK(errmsg_of(err) == "bad factor 1");
        CHECK(std::string(err.what()) == "bad factor 1");
    }
    CHECK_THROWS_AS(raise<IndexError>("out of range"), Exception);
    CHECK_THROWS_AS(raise<IOError>("no file %s", "x"), std::exception);
}
