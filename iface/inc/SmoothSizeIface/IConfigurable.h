#ifndef SMOOTHSIZE_ICONFIGURABLE
#define SMOOTHSIZE_ICONFIGURABLE

#include "SmoothSizeUtil/IComponent.h"
#include "SmoothSizeUtil/Configuration.h"

namespace SmoothSize {

    /** Interface by which a component is configured.
     *
     * Callers should start from default_configuration(), update() it with
     * their own values and pass the result to configure().
     */
    class IConfigurable : public IComponent<IConfigurable> {
      public:
        virtual ~IConfigurable();

        /// Return the configuration holding default values.
        virtual Configuration default_configuration() const = 0;

        /// Accept a configuration.  Throws ValueError on bad values.
        virtual void configure(const Configuration& config) = 0;
    };

}  // namespace SmoothSize

#endif
