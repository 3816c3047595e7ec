/** A mixin giving a component a logger named after its type.
 */
#ifndef SMOOTHSIZEAUX_LOGGER
#define SMOOTHSIZEAUX_LOGGER

#include "SmoothSizeUtil/Logging.h"

#include <string>

namespace SmoothSize::Aux {

    class Logger {
      public:
        Logger(const std::string& type_name, const std::string& group_name = "smoothsize");
        virtual ~Logger();

        /// Set an instance name which then appears in the logger name.
        virtual void set_name(const std::string& name);
        virtual std::string get_name() const;

      protected:
        const std::string m_type_name, m_group_name;
        std::string m_inst_name{""};
        Log::logptr_t log;
    };

}  // namespace SmoothSize::Aux

#endif
