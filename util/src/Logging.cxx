#include "SmoothSizeUtil/Logging.h"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <functional>
#include <vector>

using namespace SmoothSize;

namespace {

    // Remember how each shared sink was made so that unshared loggers
    // may be given their own copies.
    struct SinkMaker {
        std::string key;
        std::function<Log::sinkptr_t()> make;
        std::string level;
        Log::sinkptr_t sink;
    };

    std::vector<SinkMaker>& sink_makers()
    {
        static std::vector<SinkMaker> makers;
        return makers;
    }

    Log::logptr_t base_logger()
    {
        const std::string name = "smoothsize";
        static Log::logptr_t base = nullptr;
        if (base) {
            return base;
        }
        base = spdlog::get(name);
        if (base) {
            return base;
        }
        base = std::make_shared<spdlog::logger>(name);
        spdlog::register_logger(base);
        spdlog::set_default_logger(base);
        return base;
    }

    Log::sinkptr_t leveled(Log::sinkptr_t sink, const std::string& level)
    {
        if (!level.empty()) {
            sink->set_level(spdlog::level::from_str(level));
        }
        return sink;
    }

    // At most one sink per key.  Adding a key again only resets its level.
    void add_sink(const std::string& key, std::function<Log::sinkptr_t()> make, const std::string& level)
    {
        for (auto& sm : sink_makers()) {
            if (sm.key != key) {
                continue;
            }
            sm.level = level;
            if (level.empty()) {
                sm.sink->set_level(spdlog::level::trace);
            }
            else {
                leveled(sm.sink, level);
            }
            return;
        }
        auto sink = leveled(make(), level);
        sink_makers().push_back({key, make, level, sink});
        base_logger()->sinks().push_back(sink);
        // Loggers made earlier share the base sinks.
        spdlog::apply_all([&](Log::logptr_t l) {
            if (l != base_logger()) {
                l->sinks().push_back(sink);
            }
        });
    }
}

void Log::add_file(std::string filename, std::string level)
{
    add_sink("file:" + filename, [filename]() -> sinkptr_t {
        return std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename);
    }, level);
}

void Log::add_stdout(bool color, std::string level)
{
    if (color) {
        add_sink("stdout", []() -> sinkptr_t {
            return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        }, level);
        return;
    }
    add_sink("stdout", []() -> sinkptr_t {
        return std::make_shared<spdlog::sinks::stdout_sink_mt>();
    }, level);
}

void Log::add_stderr(bool color, std::string level)
{
    if (color) {
        add_sink("stderr", []() -> sinkptr_t {
            return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        }, level);
        return;
    }
    add_sink("stderr", []() -> sinkptr_t {
        return std::make_shared<spdlog::sinks::stderr_sink_mt>();
    }, level);
}

Log::logptr_t Log::logger(std::string name, bool share_sinks)
{
    auto base = base_logger();
    if (name.empty() || name == base->name()) {
        return base;
    }
    auto log = spdlog::get(name);
    if (log) {
        return log;
    }

    if (share_sinks) {
        auto& sinks = base->sinks();
        log = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    }
    else {
        std::vector<sinkptr_t> sinks;
        for (const auto& sm : sink_makers()) {
            sinks.push_back(leveled(sm.make(), sm.level));
        }
        log = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    }
    log->set_level(base->level());
    spdlog::register_logger(log);
    return log;
}

void Log::set_level(std::string level, std::string which)
{
    auto lvl = spdlog::level::from_str(level);

    if (which.empty()) {
        base_logger()->set_level(lvl);
        spdlog::set_level(lvl);
        return;
    }
    logger(which)->set_level(lvl);
}

void Log::set_pattern(std::string pattern, std::string which)
{
    if (which.empty()) {
        spdlog::set_pattern(pattern);
        return;
    }
    logger(which)->set_pattern(pattern);
}

void Log::default_logging(const std::string& output, std::string level, bool with_env)
{
    if (output == "stdout") {
        add_stdout(true, level);
    }
    else if (output == "stderr") {
        add_stderr(true, level);
    }
    else if (!output.empty()) {
        add_file(output, level);
    }
    if (!level.empty()) {
        set_level(level);
    }
    if (with_env) {
        spdlog::cfg::load_env_levels();
    }
}
