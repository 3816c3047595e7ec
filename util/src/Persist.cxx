#include "SmoothSizeUtil/Persist.h"
#include "SmoothSizeUtil/Exceptions.h"
#include "SmoothSizeUtil/String.h"
#include "SmoothSizeUtil/Logging.h"

#include <cstdlib>              // getenv
#include <fstream>
#include <memory>
#include <sstream>

using namespace SmoothSize;

bool Persist::exists(const std::string& path)
{
    return boost::filesystem::exists(path);
}

std::vector<std::string> Persist::search_paths()
{
    std::vector<std::string> ret;
    const char* cpath = std::getenv("SMOOTHSIZE_PATH");
    if (!cpath) {
        return ret;
    }
    for (auto dir : String::split(cpath, ":")) {
        if (!dir.empty()) {
            ret.push_back(dir);
        }
    }
    return ret;
}

std::string Persist::resolve(const std::string& filename)
{
    if (filename.empty()) {
        return "";
    }
    if (filename[0] == '/') {
        return exists(filename) ? filename : "";
    }
    if (exists(filename)) {
        return filename;
    }
    for (const auto& dir : search_paths()) {
        boost::filesystem::path maybe = boost::filesystem::path(dir) / filename;
        if (boost::filesystem::exists(maybe)) {
            return maybe.string();
        }
    }
    return "";
}

std::string Persist::slurp(const std::string& filename)
{
    std::string path = resolve(filename);
    if (path.empty()) {
        raise<IOError>("no such file: %s", filename);
    }
    std::ifstream fstr(path);
    if (!fstr) {
        raise<IOError>("failed to open: %s", path);
    }
    std::stringstream ss;
    ss << fstr.rdbuf();
    return ss.str();
}

Configuration Persist::loads(const std::string& text)
{
    Json::CharReaderBuilder rbuilder;
    std::unique_ptr<Json::CharReader> reader(rbuilder.newCharReader());
    Configuration ret;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &ret, &errs)) {
        raise<ValueError>("failed to parse JSON: %s", errs);
    }
    return ret;
}

Configuration Persist::load(const std::string& filename)
{
    return loads(slurp(filename));
}

std::string Persist::dumps(const Configuration& cfg, bool pretty)
{
    Json::StreamWriterBuilder wbuilder;
    if (!pretty) {
        wbuilder["indentation"] = "";
    }
    return Json::writeString(wbuilder, cfg);
}

void Persist::dump(const std::string& filename, const Configuration& cfg, bool pretty)
{
    std::ofstream fstr(filename);
    if (!fstr) {
        raise<IOError>("failed to open for writing: %s", filename);
    }
    fstr << dumps(cfg, pretty) << "\n";
    if (!fstr) {
        raise<IOError>("failed to write: %s", filename);
    }
}

Persist::TempDir::TempDir(const std::string& pattern, bool in_tmp)
{
    auto rel = boost::filesystem::unique_path(pattern);
    if (in_tmp) {
        path = boost::filesystem::temp_directory_path() / rel;
    }
    else {
        path = rel;
    }
    boost::filesystem::create_directories(path);
}

Persist::TempDir::~TempDir()
{
    if (keep) {
        return;
    }
    boost::system::error_code ec;
    boost::filesystem::remove_all(path, ec);
    if (ec) {
        auto log = Log::logger("util");
        log->warn("failed to remove temporary directory {}: {}", path.string(), ec.message());
    }
}
