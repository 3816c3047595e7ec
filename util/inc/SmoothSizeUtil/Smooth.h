/// Functions to find "smooth" sizes.
///
/// A number is smooth with respect to a set of factors if its prime
/// factorization holds only primes from that set.  DFT implementations
/// run their fast Cooley-Tukey paths on smooth sizes and fall back to
/// slower general algorithms (eg Bluestein) otherwise so it pays to pad
/// an array to the nearest smooth size.
///
/// See SmoothTable.h for a precomputed alternative to the search here.

#ifndef SMOOTHSIZEUTIL_SMOOTH
#define SMOOTHSIZEUTIL_SMOOTH

#include "SmoothSizeUtil/Configuration.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace SmoothSize::Smooth {

    /// Signed so that non-positive input can be rejected.
    using number_t = int64_t;

    /// The allowed factors.  These should be primes but this is not
    /// checked.  Order and repetition do not matter.
    using factors_t = std::vector<number_t>;

    /// Map from prime to the maximum power of that prime to consider.
    using exponents_t = std::map<number_t, int>;

    /// Map from prime to its power in a factorization.
    using factorization_t = std::map<number_t, int>;

    /// The factors optimized by common DFT libraries: {2,3,5,7}.
    const factors_t& default_factors();

    /// Maximum exponents giving a complete table of 7-smooth numbers
    /// below 7^13.
    const exponents_t& default_exponents();

    /// The result of a search for a smooth number.
    struct Found {
        number_t value{0};

        /// Set when the search hit the lower boundary and the value
        /// was clamped to the smallest allowed factor.
        std::optional<std::string> warning{};

        bool clamped() const { return warning.has_value(); }
    };

    /// Throw ValueError unless factors is non-empty with all
    /// elements at least 2.
    void validate(const factors_t& factors);

    /// Return the smallest allowed factor.
    number_t smallest(const factors_t& factors);

    /// Return the full prime factorization of n by trial division.  An
    /// empty map is returned for n=1.  Throws ValueError if n < 1.
    factorization_t factorize(number_t n);

    /// Return true if every prime factor of n is an allowed factor.
    ///
    /// By definition 1 is not smooth.  Throws ValueError if n < 1 or the
    /// factors are not valid.
    bool is_smooth(number_t n, const factors_t& factors = default_factors());

    /// Step from n, up if ascending else down, until a smooth number is
    /// found.
    ///
    /// A descending search that ends below the smallest allowed factor
    /// returns that factor and sets Found::warning.  An ascending search
    /// always ends.
    Found nearest(number_t n, bool ascending, const factors_t& factors = default_factors());

    /// Return the closest smooth size for one dimension.
    Found closest_optimal(number_t n, bool ascending = true,
                          const factors_t& factors = default_factors());

    /// Return the closest smooth size for each dimension, in order.  A
    /// clamped element does not stop the others.
    std::vector<Found> closest_optimal(const std::vector<number_t>& dims, bool ascending = true,
                                       const factors_t& factors = default_factors());

    /// Return just the values of a vector of search results.
    std::vector<number_t> values(const std::vector<Found>& found);

    /// Return the smallest of p^maxexp[p].  Every smooth number below this
    /// has each power less than its maximum.  Throws ValueError if the
    /// exponents are empty or hold a negative power or a factor less
    /// than 2.  Saturates at the largest number_t.
    number_t ceiling(const exponents_t& maxexp);

    /// Return for each factor the smallest power reaching the ceiling.  A
    /// table built from these is complete below the ceiling.
    exponents_t exponents_for(const factors_t& factors, number_t ceiling);

    /// Return the allowed factors named by the exponents.
    factors_t factors_of(const exponents_t& maxexp);

    /// Convert a JSON array of integers to factors.  Throws ValueError on
    /// non-integer or invalid values.
    factors_t to_factors(const Configuration& cfg);

    /// Convert a JSON object mapping prime (as a key string) to maximum
    /// power.  Throws ValueError on malformed values.
    exponents_t to_exponents(const Configuration& cfg);

    Configuration to_config(const factors_t& factors);
    Configuration to_config(const exponents_t& maxexp);

}  // namespace SmoothSize::Smooth

#endif
