#include "SmoothSizeUtil/Configuration.h"

using namespace SmoothSize;

SmoothSize::Configuration SmoothSize::branch(SmoothSize::Configuration cfg, const std::string& dotpath)
{
    std::vector<std::string> path;
    boost::algorithm::split(path, dotpath, boost::algorithm::is_any_of("."));
    for (auto name : path) {
        if (!cfg.isObject()) {
            return Configuration();
        }
        cfg = cfg[name];
    }
    return cfg;
}

SmoothSize::Configuration SmoothSize::update(SmoothSize::Configuration& a, SmoothSize::Configuration& b)
{
    if (a.isNull()) {
        a = b;
        return b;
    }
    if (!a.isObject() || !b.isObject()) {
        return a;
    }

    for (const auto& key : b.getMemberNames()) {
        if (a[key].isObject()) {
            update(a[key], b[key]);
        }
        else {
            a[key] = b[key];
        }
    }
    return a;
}

SmoothSize::Configuration SmoothSize::update(SmoothSize::Configuration& a, const SmoothSize::Configuration& b)
{
    auto c = b;
    return update(a, c);
}
