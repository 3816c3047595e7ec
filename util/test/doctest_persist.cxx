#include <doctest/doctest.h>
#include "SmoothSizeUtil/Logging.h"
#include "SmoothSizeUtil/Persist.h"
#include "SmoothSizeUtil/Exceptions.h"

#include <boost/filesystem/fstream.hpp>
#include <cstdlib>

using spdlog::debug;
using namespace SmoothSize;

TEST_CASE("persist checks")
{
    CHECK(Persist::exists("/etc"));
    CHECK(Persist::exists("/etc/hosts"));

    setenv("SMOOTHSIZE_PATH", "/etc:/usr:/var", 1);
    std::string etchosts = Persist::resolve("hosts");
    CHECK(etchosts == "/etc/hosts");

    std::string dne = Persist::resolve("this_file-really_should-not_exist");
    CHECK(dne.empty());
    CHECK_THROWS_AS(Persist::slurp("this_file-really_should-not_exist"), IOError);
    unsetenv("SMOOTHSIZE_PATH");
}

TEST_CASE("persist json")
{
    CHECK_THROWS_AS(Persist::loads("{ not json"), ValueError);

    Persist::TempDir td;
    const std::string fname = (td.path / "sizer.json").string();

    Configuration cfg;
    cfg["type"] = "FactorSizer";
    cfg["data"]["factors"][0] = 2;
    cfg["data"]["factors"][1] = 3;
    Persist::dump(fname, cfg, true);

    auto back = Persist::load(fname);
    CHECK(back == cfg);
    CHECK(Persist::dumps(cfg).find('\n') == std::string::npos);

    setenv("SMOOTHSIZE_PATH", td.path.string().c_str(), 1);
    CHECK(Persist::resolve("sizer.json") == fname);
    unsetenv("SMOOTHSIZE_PATH");

    CHECK_THROWS_AS(Persist::dump((td.path / "no" / "such" / "dir.json").string(), cfg), IOError);
}

TEST_CASE("persist tempdir")
{
    boost::filesystem::path path;

    {
        Persist::TempDir p;
        path = p.path;
        debug("tempdir: {}", path.native());
        REQUIRE(boost::filesystem::exists(path));
    }
    REQUIRE(! boost::filesystem::exists(path));

    {
        Persist::TempDir p;
        p.keep = true;
        path = p.path;
        REQUIRE(boost::filesystem::exists(path));
    }
    REQUIRE(boost::filesystem::exists(path));
    boost::filesystem::remove_all(path);
}
