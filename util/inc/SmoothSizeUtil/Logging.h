#ifndef SMOOTHSIZEUTIL_LOGGING
#define SMOOTHSIZEUTIL_LOGGING

// See this header for info about compile time control over SPDLOG levels.
#include "SmoothSizeUtil/Spdlog.h"

#include <memory>
#include <string>

namespace SmoothSize {

    namespace Log {

        typedef std::shared_ptr<spdlog::logger> logptr_t;
        typedef std::shared_ptr<spdlog::sinks::sink> sinkptr_t;

        // A shared collection of sinks is kept for the loggers made
        // through this API.  No sinks are added by default.  The
        // application should add some if output is wanted.  All sinks
        // added are applied to any subsequently made loggers.  There is
        // at most one stdout, one stderr and one sink per file name.
        // Adding one again only changes its level.

        // Add a log file sink with optional level.
        void add_file(std::string filename, std::string level = "");

        // Add a standard out console sink with optional level.
        void add_stdout(bool color = true, std::string level = "");

        // Add a standard err console sink with optional level.
        void add_stderr(bool color = true, std::string level = "");

        // Return a logger by name, making it if it does not yet exist.
        // If share_sinks is true, the logger is attached to the shared
        // set of sinks made by prior add_*() calls.  If false, copies
        // are attached (needed if custom patterns will be set on the
        // logger).
        logptr_t logger(std::string name, bool share_sinks = true);

        // Set log level.  If which is empty, set the level of all logs.
        // Otherwise, set the named logger.
        void set_level(std::string level, std::string which = "");

        // Set logging pattern on the default or given logger's sinks.
        void set_pattern(std::string pattern, std::string which = "");

        // Set up logging.  This is intended for a oneliner in main().
        // Output can be "stderr", "stdout" or a file name.  If with_env
        // is true, levels given in the SPDLOG_LEVEL environment variable
        // are applied last.
        void default_logging(const std::string& output = "stderr",
                             std::string level = "", bool with_env = true);

    }  // namespace Log

}  // namespace SmoothSize

#endif
