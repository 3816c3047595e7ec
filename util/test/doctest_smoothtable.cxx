#include <doctest/doctest.h>
#include "SmoothSizeUtil/Logging.h"
#include "SmoothSizeUtil/SmoothTable.h"
#include "SmoothSizeUtil/Exceptions.h"
#include "SmoothSizeUtil/Persist.h"

#include <sstream>

using namespace SmoothSize;
using Smooth::number_t;
using spdlog::debug;

TEST_CASE("smooth table build small")
{
    auto table = SmoothTable::build({{2, 4}, {3, 3}}, 100);
    const SmoothTable::vector_t want{2, 3, 4, 6, 8, 9, 12, 16, 18, 24, 27, 36, 48, 54, 72};
    CHECK(table.values() == want);
    CHECK(table.front() == 2);
    CHECK(table.back() == 72);
    CHECK(table.contains(54));
    CHECK_FALSE(table.contains(81));  // 3^4 is beyond the exponent
    CHECK_FALSE(table.contains(1));

    SUBCASE("derived ceiling") {
        auto derived = SmoothTable::build({{2, 4}, {3, 3}});
        CHECK(derived.values() == SmoothTable::vector_t{2, 3, 4, 6, 8, 9, 12});
    }

    SUBCASE("tiny ceilings") {
        CHECK(SmoothTable::build({{2, 4}}, 1).empty());
        CHECK(SmoothTable::build({{2, 4}}, 2).empty());
        CHECK(SmoothTable::build({{2, 4}}, 3).values() == SmoothTable::vector_t{2});
    }

    SUBCASE("invalid exponents") {
        CHECK_THROWS_AS(SmoothTable::build({}), ValueError);
        CHECK_THROWS_AS(SmoothTable::build({{2, -2}}), ValueError);
        CHECK_THROWS_AS(SmoothTable::build({{0, 2}}, 10), ValueError);
    }
}

TEST_CASE("smooth table build default")
{
    const auto& maxexp = Smooth::default_exponents();
    auto table = SmoothTable::build(maxexp);
    debug("default table: {} entries from {} to {}", table.size(), table.front(), table.back());

    CHECK(table.size() == 10638);
    CHECK(table.front() == 2);
    CHECK(table.back() == 96877265625LL);
    CHECK(table.back() < Smooth::ceiling(maxexp));
    CHECK(table.values()[7999] == 14224896000LL);

    for (size_t ind = 1; ind < table.size(); ++ind) {
        REQUIRE(table.values()[ind - 1] < table.values()[ind]);
    }

    SUBCASE("lookups agree with the search") {
        const auto& fs = Smooth::default_factors();
        for (number_t x = 2; x < 5000; ++x) {
            REQUIRE(table.lookup_larger(x) == Smooth::nearest(x, true, fs).value);
            REQUIRE(table.lookup_smaller(x) == Smooth::nearest(x, false, fs).value);
        }
        for (number_t x : {123456789LL, 1000000007LL, 96877265625LL}) {
            CHECK(table.lookup_larger(x) == Smooth::nearest(x, true, fs).value);
            CHECK(table.lookup_smaller(x) == Smooth::nearest(x, false, fs).value);
        }
    }

    SUBCASE("examples") {
        CHECK(table.lookup_larger(123) == 125);
        CHECK(table.lookup_smaller(123) == 120);
        CHECK(table.lookup_larger(1) == 2);
    }
}

TEST_CASE("smooth table agrees with search for other factors")
{
    const Smooth::factors_t fs{3, 5, 11};
    const number_t ceiling = 20000;
    auto table = SmoothTable::build(Smooth::exponents_for(fs, ceiling));
    CHECK(table.back() < ceiling);
    for (number_t x = 3; x <= table.back(); ++x) {
        REQUIRE(table.lookup_larger(x) == Smooth::nearest(x, true, fs).value);
        REQUIRE(table.lookup_smaller(x) == Smooth::nearest(x, false, fs).value);
    }
}

TEST_CASE("smooth table lookup out of range")
{
    SmoothTable table(SmoothTable::vector_t{2, 3, 4, 6, 8, 9});
    CHECK(table.lookup_larger(9) == 9);
    CHECK(table.lookup_larger(7) == 8);
    CHECK_THROWS_AS(table.lookup_larger(10), IndexError);
    CHECK(table.lookup_smaller(2) == 2);
    CHECK(table.lookup_smaller(7) == 6);
    CHECK(table.lookup_smaller(100) == 9);
    CHECK_THROWS_AS(table.lookup_smaller(1), IndexError);

    SmoothTable empty;
    CHECK_THROWS_AS(empty.lookup_larger(2), IndexError);
    CHECK_THROWS_AS(empty.lookup_smaller(2), IndexError);
    CHECK_THROWS_AS(empty.front(), IndexError);
}

TEST_CASE("smooth table rejects bad sequences")
{
    CHECK_THROWS_AS(SmoothTable(SmoothTable::vector_t{1, 2, 3}), ValueError);
    CHECK_THROWS_AS(SmoothTable(SmoothTable::vector_t{2, 4, 3}), ValueError);
    CHECK_THROWS_AS(SmoothTable(SmoothTable::vector_t{2, 2, 3}), ValueError);
}

TEST_CASE("smooth table emit and parse")
{
    auto table = SmoothTable::build(Smooth::default_exponents());

    std::stringstream ss;
    table.emit(ss, 25, "sizes");
    const std::string text = ss.str();
    debug("emitted:\n{}", text);
    CHECK(text.find("static const long long sizes[25] = {") != std::string::npos);

    auto back = SmoothTable::parse(text);
    CHECK(back.size() == 25);
    CHECK(back.values() == table.prefix(25).values());

    SUBCASE("default size") {
        std::stringstream big;
        table.emit(big);
        auto loaded = SmoothTable::parse(big.str());
        CHECK(loaded.size() == 8000);
        CHECK(loaded.back() == 14224896000LL);
    }

    SUBCASE("too many requested") {
        std::stringstream tmp;
        CHECK_THROWS_AS(table.emit(tmp, table.size() + 1), IndexError);
    }

    SUBCASE("json array") {
        auto fromjson = SmoothTable::parse(" [2, 3, 4, 5]");
        CHECK(fromjson.values() == SmoothTable::vector_t{2, 3, 4, 5});
    }

    SUBCASE("malformed") {
        CHECK_THROWS_AS(SmoothTable::parse("nothing here"), ValueError);
        CHECK_THROWS_AS(SmoothTable::parse("x[] = {2, three, 4};"), ValueError);
        CHECK_THROWS_AS(SmoothTable::parse("x[] = {4, 3};"), ValueError);
    }

    SUBCASE("file") {
        Persist::TempDir td;
        const std::string fname = (td.path / "table.inc").string();
        table.emit(fname, 100);
        auto loaded = SmoothTable::load(fname);
        CHECK(loaded.values() == table.prefix(100).values());
        CHECK_THROWS_AS(SmoothTable::load((td.path / "missing.inc").string()), IOError);
    }
}
