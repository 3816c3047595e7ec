/** Persist structured information.

    Structured information is JSON (held as a Configuration).  Files are
    located either by absolute/relative path or by searching the
    directories listed in the SMOOTHSIZE_PATH environment variable.
 */

#ifndef SMOOTHSIZEUTIL_PERSIST
#define SMOOTHSIZEUTIL_PERSIST

#include "SmoothSizeUtil/Configuration.h"

#include <boost/filesystem.hpp>

#include <string>
#include <vector>

namespace SmoothSize::Persist {

    /// Return true if the path exists.
    bool exists(const std::string& path);

    /// Return the directories named in SMOOTHSIZE_PATH.
    std::vector<std::string> search_paths();

    /// Return the first path to an existing file found by trying the
    /// filename as given and then relative to each search path.  An
    /// empty string is returned if no file is found.
    std::string resolve(const std::string& filename);

    /// Return the entire contents of the file as a string.  Throws
    /// IOError if the file can not be read.
    std::string slurp(const std::string& filename);

    /// Parse JSON text.  Throws ValueError on a parse error.
    Configuration loads(const std::string& text);

    /// Resolve and load a JSON file.
    Configuration load(const std::string& filename);

    /// Serialize as JSON text.  If pretty is false, a single line is made.
    std::string dumps(const Configuration& cfg, bool pretty = false);

    /// Write JSON text to a file.  Throws IOError on failure.
    void dump(const std::string& filename, const Configuration& cfg, bool pretty = false);

    /// A temporary directory which is removed when this object is
    /// destructed unless keep is set true.
    struct TempDir {
        boost::filesystem::path path;
        bool keep{false};

        /// The pattern is as for boost::filesystem::unique_path().  If
        /// in_tmp is true the directory is made in the system temporary
        /// directory, else in the current directory.
        explicit TempDir(const std::string& pattern = "smoothsize-%%%%-%%%%-%%%%-%%%%",
                         bool in_tmp = true);
        ~TempDir();
    };

}  // namespace SmoothSize::Persist

#endif
