#ifndef SMOOTHSIZEAPPS_MAIN
#define SMOOTHSIZEAPPS_MAIN

#include "SmoothSizeIface/ISizer.h"
#include "SmoothSizeUtil/Logging.h"

#include <iostream>
#include <string>
#include <vector>

namespace SmoothSize {

    /** The smooth-size application.
     *
     * Use is cmdline(), then initialize(), then operator()().  The
     * setters may be used instead of cmdline() to drive it from code.
     */
    class Main {
      public:
        explicit Main(std::ostream& out = std::cout);
        ~Main();

        /// Parse command line arguments.  Return non-zero if the caller
        /// should exit with that code (eg, after printing help).
        int cmdline(int argc, char* argv[]);

        /// Set up logging and make the sizer.
        void initialize();

        /// Find and print a smooth size for each dimension and emit the
        /// table if requested.  Return the process exit code.
        int operator()();

        void add_logsink(const std::string& log, const std::string& level = "");
        void set_loglevel(const std::string& log, const std::string& level = "");

        void add_dim(Smooth::number_t dim) { m_dims.push_back(dim); }
        void add_factor(Smooth::number_t factor) { m_factors.push_back(factor); }
        void set_descending(bool descending = true) { m_descending = descending; }
        void set_table(bool table = true) { m_table = table; }
        void set_factorize(bool factorize = true) { m_factorize = factorize; }
        void set_config(const std::string& filename) { m_config = filename; }
        void set_emit(const std::string& filename, size_t nelements = 8000);

        ISizer::pointer sizer() const { return m_sizer; }

      private:
        std::ostream& m_out;
        std::vector<Smooth::number_t> m_dims;
        Smooth::factors_t m_factors;
        bool m_descending{false};
        bool m_table{false};
        bool m_factorize{false};
        std::string m_config{""};
        std::string m_emit{""};
        size_t m_nelements{8000};
        Smooth::number_t m_ceiling{0};
        std::vector<std::string> m_logsinks, m_loglevels;

        ISizer::pointer m_sizer;
        Log::logptr_t l;
    };

}  // namespace SmoothSize

#endif
