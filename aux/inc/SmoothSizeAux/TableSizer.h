/** Find smooth sizes by lookup in a precomputed table.

    The table is built from maximum exponents when configured, or loaded
    from a file made by SmoothTable::emit().  Lookups cost O(log n) but a
    query outside of the table throws IndexError.  Unlike FactorSizer, a
    descending query below the first entry is not clamped.
 */

#ifndef SMOOTHSIZEAUX_TABLESIZER
#define SMOOTHSIZEAUX_TABLESIZER

#include "SmoothSizeIface/ISizer.h"
#include "SmoothSizeIface/IConfigurable.h"
#include "SmoothSizeAux/Logger.h"
#include "SmoothSizeUtil/SmoothTable.h"

namespace SmoothSize::Aux {

    class TableSizer : public Aux::Logger,
                       public ISizer, public IConfigurable {
      public:
        TableSizer();
        virtual ~TableSizer();

        virtual void configure(const SmoothSize::Configuration& config);
        virtual SmoothSize::Configuration default_configuration() const;

        virtual Smooth::Found nearest(number_t n, bool ascending) const;

        const SmoothTable& table() const { return m_table; }

      private:

        // Configure: exponents
        //
        // Object mapping each allowed prime (as a string key) to the
        // maximum power to enumerate.  Default is {"2":40, "3":25, "5":17,
        // "7":13} which is complete below 7^13.
        Smooth::exponents_t m_exponents;

        // Configure: ceiling
        //
        // Exclusive upper bound on table values.  Zero (default) means the
        // smallest prime power given by exponents, below which the table
        // is complete.
        number_t m_ceiling{0};

        // Configure: filename
        //
        // If given, load the table from this file instead of building it.
        std::string m_filename{""};

        SmoothTable m_table;
    };

}  // namespace SmoothSize::Aux

#endif
