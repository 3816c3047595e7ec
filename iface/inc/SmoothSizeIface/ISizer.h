#ifndef SMOOTHSIZE_ISIZER
#define SMOOTHSIZE_ISIZER

#include "SmoothSizeUtil/IComponent.h"
#include "SmoothSizeUtil/Smooth.h"

namespace SmoothSize {

    /** A sizer finds the smooth size nearest to a given size.
     *
     * A sizer searching up returns the smallest smooth number at least as
     * large as n.  Searching down it returns the largest smooth number no
     * larger than n.  An implementation may fill Found::warning when it
     * must return something else.
     */
    class ISizer : public IComponent<ISizer> {
      public:
        typedef Smooth::number_t number_t;

        virtual ~ISizer();

        virtual Smooth::Found nearest(number_t n, bool ascending) const = 0;
    };

}  // namespace SmoothSize

#endif
