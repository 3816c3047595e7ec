#include <doctest/doctest.h>
#include "SmoothSizeApps/Main.h"
#include "SmoothSizeAux/TableSizer.h"
#include "SmoothSizeUtil/Exceptions.h"
#include "SmoothSizeUtil/Logging.h"
#include "SmoothSizeUtil/Persist.h"
#include "SmoothSizeUtil/SmoothTable.h"

#include <sstream>
#include <vector>

using namespace SmoothSize;

namespace {
    // Run Main over a command line given as words.
    int run(std::vector<std::string> words, std::ostream& out)
    {
        words.insert(words.begin(), "smooth-size");
        std::vector<char*> argv;
        for (auto& w : words) {
            argv.push_back(w.data());
        }
        Main m(out);
        int rc = m.cmdline(argv.size(), argv.data());
        if (rc) {
            return rc;
        }
        m.initialize();
        return m();
    }
}

TEST_CASE("app search")
{
    std::stringstream out;
    CHECK(0 == run({"-L", "warn", "123", "23", "615"}, out));
    CHECK(out.str() == "123 -> 125\n23 -> 24\n615 -> 625\n");
}

TEST_CASE("app descending with factors")
{
    std::stringstream out;
    CHECK(0 == run({"-L", "warn", "-d", "-f", "2", "-f", "3", "123"}, out));
    CHECK(out.str() == "123 -> 108\n");
}

TEST_CASE("app clamp continues")
{
    std::stringstream out;
    CHECK(0 == run({"-L", "error", "--descending", "1", "123"}, out));
    CHECK(out.str() == "1 -> 2\n123 -> 120\n");
}

TEST_CASE("app table and factorize")
{
    std::stringstream out;
    CHECK(0 == run({"-L", "warn", "-t", "-F", "123"}, out));
    CHECK(out.str() == "123 (3 * 41) -> 125 (5^3)\n");
}

TEST_CASE("app table with factors")
{
    std::stringstream out;
    CHECK(0 == run({"-L", "warn", "-t", "-C", "1000", "-f", "2", "-f", "3", "-d", "123"}, out));
    CHECK(out.str() == "123 -> 108\n");
}

TEST_CASE("app emit")
{
    Persist::TempDir td;
    const std::string fname = (td.path / "table.inc").string();

    std::stringstream out;
    CHECK(0 == run({"-L", "warn", "-e", fname, "-n", "100"}, out));
    auto table = SmoothTable::load(fname);
    CHECK(table.size() == 100);
    CHECK(table.values() == SmoothTable::build(Smooth::default_exponents()).prefix(100).values());
}

TEST_CASE("app config file")
{
    Persist::TempDir td;
    const std::string fname = (td.path / "sizer.json").string();
    Configuration cfg;
    cfg["type"] = "FactorSizer";
    cfg["data"]["factors"][0] = 2;
    Persist::dump(fname, cfg);

    std::stringstream out;
    CHECK(0 == run({"-L", "warn", "-c", fname, "-d", "123"}, out));
    CHECK(out.str() == "123 -> 64\n");
}

TEST_CASE("app config file with bad values")
{
    Persist::TempDir td;
    const std::string big = (td.path / "big.json").string();
    Configuration cfg;
    cfg["type"] = "FactorSizer";
    cfg["data"]["factors"][0] = Json::UInt64(18446744073709551615ULL);
    Persist::dump(big, cfg);

    const std::string arr = (td.path / "array.json").string();
    Persist::dump(arr, Persist::loads("[2, 3]"));

    const std::string data = (td.path / "data.json").string();
    Persist::dump(data, Persist::loads(R"({"type": "TableSizer", "data": 7})"));

    const std::string word = (td.path / "word.json").string();
    Persist::dump(word, Persist::loads(R"({"type": "TableSizer", "data": {"ceiling": "big"}})"));

    std::stringstream out;
    CHECK_THROWS_AS(run({"-L", "warn", "-c", big, "12"}, out), ValueError);
    CHECK_THROWS_AS(run({"-L", "warn", "-c", word, "-f", "2", "12"}, out), ValueError);
    CHECK_THROWS_AS(run({"-L", "warn", "-c", arr, "12"}, out), ValueError);
    CHECK_THROWS_AS(run({"-L", "warn", "-c", data, "-f", "2", "12"}, out), ValueError);
    CHECK(out.str().empty());
}

TEST_CASE("app runs share one log sink")
{
    std::stringstream out;
    CHECK(0 == run({"-L", "error", "12"}, out));
    const size_t nsinks = Log::logger("")->sinks().size();
    CHECK(0 == run({"-L", "error", "12"}, out));
    CHECK(0 == run({"-L", "error", "-l", "stderr:error", "12"}, out));
    CHECK(Log::logger("")->sinks().size() == nsinks);
}

TEST_CASE("app errors")
{
    std::stringstream out;
    CHECK(1 == run({"--help"}, out));
    CHECK(out.str().find("--descending") != std::string::npos);

    CHECK_THROWS_AS(run({"-L", "warn", "0"}, out), ValueError);
    CHECK_THROWS_AS(run({"-L", "warn", "-t", "1000000000000"}, out), IndexError);
    CHECK_THROWS_AS(run({"-L", "warn", "-c", "no-such-sizer.json", "12"}, out), IOError);

    Main m(out);
    CHECK_THROWS_AS(m(), ValueError);
}
