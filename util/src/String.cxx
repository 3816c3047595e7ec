#include "SmoothSizeUtil/String.h"

std::vector<std::string> SmoothSize::String::split(const std::string& in, const std::string& delim)
{
    std::vector<std::string> chunks;
    if (in.empty()) {
        return chunks;
    }
    boost::split(chunks, in, boost::is_any_of(delim), boost::token_compress_on);
    return chunks;
}

std::pair<std::string, std::string> SmoothSize::String::parse_pair(const std::string& in, const std::string& delim)
{
    std::vector<std::string> chunks = split(in, delim);
    if (chunks.empty()) {
        return std::make_pair(std::string(""), std::string(""));
    }
    std::string first = chunks[0];
    std::string second = "";
    if (chunks.size() > 1) {
        second = chunks[1];
    }
    return make_pair(first, second);
}
