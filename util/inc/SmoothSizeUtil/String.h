#ifndef SMOOTHSIZEUTIL_STRING
#define SMOOTHSIZEUTIL_STRING

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include <string>
#include <vector>
#include <sstream>

namespace SmoothSize::String {

    std::vector<std::string> split(const std::string& in, const std::string& delim = ":");

    std::pair<std::string, std::string> parse_pair(const std::string& in, const std::string& delim = ":");

    /// Join the stream representation of each element with delim.
    template <typename Sequence>
    std::string join(const Sequence& seq, const std::string& delim = ",")
    {
        std::stringstream ss;
        std::string comma = "";
        for (const auto& one : seq) {
            ss << comma << one;
            comma = delim;
        }
        return ss.str();
    }

    // boost::format wrappers with positional and printf style markers.

    inline boost::format format_flatten(boost::format f) { return f; }

    template <typename TYPE, typename... MORE>
    boost::format format_flatten(boost::format start, TYPE o, MORE... objs)
    {
        start % o;
        return format_flatten(start, objs...);
    }

    template <typename... TYPES>
    std::string format(const std::string& form, TYPES... objs)
    {
        auto final = format_flatten(boost::format(form), objs...);
        return final.str();
    }

}  // namespace SmoothSize::String

#endif
