/** Helpers for using ISizer components. */

#ifndef SMOOTHSIZEAUX_SIZERTOOLS
#define SMOOTHSIZEAUX_SIZERTOOLS

#include "SmoothSizeIface/ISizer.h"
#include "SmoothSizeUtil/Configuration.h"
#include "SmoothSizeUtil/Logging.h"

#include <string>
#include <vector>

namespace SmoothSize::Aux::SizerTools {

    /// Apply the sizer to each dimension, in order.  Each clamped element
    /// is logged with its index when a logger is given and the rest are
    /// still processed.
    std::vector<Smooth::Found> nearest(const ISizer::pointer& sizer,
                                       const std::vector<Smooth::number_t>& dims,
                                       bool ascending = true,
                                       Log::logptr_t log = nullptr);

    /// Known sizer type names.
    std::vector<std::string> known_types();

    /// Make and configure a sizer from {"type": "...", "data": {...}}.
    /// The data is applied on top of the sizer's default configuration.
    /// Throws ValueError for an unknown type or a malformed configuration.
    ISizer::pointer make_sizer(const Configuration& cfg);

    /// Make a sizer of the given type with its default configuration.
    ISizer::pointer default_sizer(const std::string& type);

}  // namespace SmoothSize::Aux::SizerTools

#endif
