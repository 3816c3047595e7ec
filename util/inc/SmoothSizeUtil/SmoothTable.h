/** A precomputed table of smooth numbers.

    The table holds every smooth number greater than 1 and strictly below
    a ceiling, in ascending order.  Once built it is never modified so it
    may be read from any number of threads.

    Within its coverage, lookup_larger(x) equals
    Smooth::nearest(x, true).value and lookup_smaller(x) equals
    Smooth::nearest(x, false).value when that search does not clamp.

    Building is expensive and meant to be done once.  A prefix of the
    table may be emitted as a C++ source fragment and loaded back.
 */

#ifndef SMOOTHSIZEUTIL_SMOOTHTABLE
#define SMOOTHSIZEUTIL_SMOOTHTABLE

#include "SmoothSizeUtil/Smooth.h"

#include <iosfwd>
#include <string>
#include <vector>

namespace SmoothSize {

    class SmoothTable {
      public:
        using number_t = Smooth::number_t;
        using vector_t = std::vector<number_t>;
        using const_iterator = vector_t::const_iterator;

        /// An empty table.
        SmoothTable() = default;

        /// Adopt an existing sequence.  Throws ValueError unless it is
        /// strictly increasing with all elements greater than 1.
        explicit SmoothTable(vector_t values);

        /// Enumerate all products of powers up to maxexp[p] of each prime
        /// p that are strictly less than the ceiling.
        static SmoothTable build(const Smooth::exponents_t& maxexp, number_t ceiling);

        /// As above with the ceiling from Smooth::ceiling(maxexp) which
        /// gives a table complete below that ceiling.
        static SmoothTable build(const Smooth::exponents_t& maxexp);

        /// Return the smallest entry >= x.  Throws IndexError if x is
        /// larger than every entry.
        number_t lookup_larger(number_t x) const;

        /// Return the largest entry <= x.  Throws IndexError if every
        /// entry is larger than x.
        number_t lookup_smaller(number_t x) const;

        /// True if x is an entry.
        bool contains(number_t x) const;

        size_t size() const { return m_values.size(); }
        bool empty() const { return m_values.empty(); }
        number_t front() const;
        number_t back() const;
        const_iterator begin() const { return m_values.begin(); }
        const_iterator end() const { return m_values.end(); }
        const vector_t& values() const { return m_values; }

        /// Return a table holding at most the first n entries.
        SmoothTable prefix(size_t n) const;

        /// Write the first n_elements entries as a C++ source fragment
        /// declaring an array with the given name.  Throws IndexError if
        /// the table has fewer entries.
        void emit(std::ostream& out, size_t n_elements = 8000,
                  const std::string& name = "smooth_table") const;

        /// As above, to a file.  Throws IOError if it can not be written.
        void emit(const std::string& filename, size_t n_elements = 8000,
                  const std::string& name = "smooth_table") const;

        /// Read a table from text made by emit().  A JSON array of
        /// integers is also accepted.
        static SmoothTable parse(const std::string& text);

        /// Resolve a file with Persist and parse it.
        static SmoothTable load(const std::string& filename);

      private:
        vector_t m_values;
    };

}  // namespace SmoothSize

#endif
