/** Configuration is a JSON value.

    The helpers here read and write configuration values by dotted path,
    eg "a.b.c", with a default returned when the value is absent.
 */
#ifndef SMOOTHSIZEUTIL_CONFIGURATION
#define SMOOTHSIZEUTIL_CONFIGURATION

#include "SmoothSizeUtil/Exceptions.h"

#include <json/json.h>

#include <boost/algorithm/string.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace SmoothSize {

    typedef Json::Value Configuration;

    /// Convert a configuration value to a particular type.  Null gives
    /// def.  A value of the wrong type raises ValueError.
    template <typename T>
    T convert(const Configuration& cfg, const T& def = T());

    template <>
    inline int64_t convert<int64_t>(const Configuration& cfg, const int64_t& def)
    {
        if (cfg.isNull()) {
            return def;
        }
        if (!cfg.isInt64()) {
            raise<ValueError>("not a 64 bit integer: %s", cfg.toStyledString());
        }
        return cfg.asInt64();
    }
    template <>
    inline std::string convert<std::string>(const Configuration& cfg, const std::string& def)
    {
        if (cfg.isNull()) {
            return def;
        }
        if (!cfg.isString()) {
            raise<ValueError>("not a string: %s", cfg.toStyledString());
        }
        return cfg.asString();
    }

    /// Follow a dot.separated.path and return the branch there.
    Configuration branch(Configuration cfg, const std::string& dotpath);

    /// Merge dictionary b into a, return a.
    Configuration update(Configuration& a, Configuration& b);
    Configuration update(Configuration& a, const Configuration& b);

    /// Return the value at dotpath converted to T, or def if missing.
    template <typename T>
    T get(Configuration cfg, const std::string& dotpath, const T& def = T())
    {
        return convert(branch(cfg, dotpath), def);
    }

    /// Make a Configuration from the value and set it at dotpath.
    template <typename T>
    void put(Configuration& cfg, const std::string& dotpath, const T& val)
    {
        Configuration* ptr = &cfg;
        std::vector<std::string> path;
        boost::algorithm::split(path, dotpath, boost::algorithm::is_any_of("."));
        for (auto name : path) {
            ptr = &(*ptr)[name];
        }
        *ptr = val;
    }

}  // namespace SmoothSize

#endif
