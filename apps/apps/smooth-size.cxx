// Print the nearest smooth size for each dimension given on the command line.

#include "SmoothSizeApps/Main.h"
#include "SmoothSizeUtil/Exceptions.h"

#include <boost/program_options/errors.hpp>

#include <iostream>

using namespace SmoothSize;

int main(int argc, char* argv[])
{
    Main m;
    try {
        int rc = m.cmdline(argc, argv);
        if (rc) {
            return rc;
        }
        m.initialize();
        return m();
    }
    catch (const boost::program_options::error& err) {
        std::cerr << "smooth-size: " << err.what() << "\n";
        return 1;
    }
    catch (const Exception& err) {
        std::cerr << "smooth-size: " << errmsg_of(err) << "\n";
        return 1;
    }
    return 0;
}
