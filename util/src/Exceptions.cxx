#include "SmoothSizeUtil/Exceptions.h"

using namespace SmoothSize;

const char* Exception::what() const throw()
{
    const std::string* msg = boost::get_error_info<errmsg>(*this);
    if (msg) {
        return msg->c_str();
    }
    return std::exception::what();
}

std::string SmoothSize::errmsg_of(const Exception& err)
{
    const std::string* msg = boost::get_error_info<errmsg>(err);
    if (msg) {
        return *msg;
    }
    return "";
}
