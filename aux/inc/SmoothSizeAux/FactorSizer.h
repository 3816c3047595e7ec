/** Find smooth sizes by stepping and trial division.

    Exact for any size but each step pays for a trial division so large
    gaps between smooth numbers make it slow.  See TableSizer for a
    bounded but fast alternative.
 */

#ifndef SMOOTHSIZEAUX_FACTORSIZER
#define SMOOTHSIZEAUX_FACTORSIZER

#include "SmoothSizeIface/ISizer.h"
#include "SmoothSizeIface/IConfigurable.h"
#include "SmoothSizeAux/Logger.h"

namespace SmoothSize::Aux {

    class FactorSizer : public Aux::Logger,
                        public ISizer, public IConfigurable {
      public:
        FactorSizer();
        virtual ~FactorSizer();

        virtual void configure(const SmoothSize::Configuration& config);
        virtual SmoothSize::Configuration default_configuration() const;

        /// A clamped result carries its warning and is logged at debug level.
        virtual Smooth::Found nearest(number_t n, bool ascending) const;

        const Smooth::factors_t& factors() const { return m_factors; }

      private:

        // Configure: factors
        //
        // Array of allowed prime factors.  Default is [2,3,5,7].
        Smooth::factors_t m_factors;
    };

}  // namespace SmoothSize::Aux

#endif
