#include "SmoothSizeAux/Logger.h"

using namespace SmoothSize;

Aux::Logger::Logger(const std::string& type_name, const std::string& group_name)
  : m_type_name(type_name)
  , m_group_name(group_name)
  , log(Log::logger(group_name + "/" + type_name))
{
}

Aux::Logger::~Logger() {}

void Aux::Logger::set_name(const std::string& name)
{
    m_inst_name = name;
    std::string lname = m_group_name + "/" + m_type_name;
    if (!name.empty()) {
        lname += ":" + name;
    }
    log = Log::logger(lname);
}

std::string Aux::Logger::get_name() const { return m_inst_name; }
